#include <cmath>
#include <stdexcept>

#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "voxcut/embedding.hpp"

using namespace voxcut;
using voxcut::testing::TempDir;

TEST(Npy, HeaderIsAlignedAndDataFollows) {
  TempDir dir;
  std::string path = dir.file("m.npy");
  EmbeddingMatrix m = {{1.0f, 2.0f, 3.0f}, {4.0f, 5.0f, 6.0f}};

  save_npy(path, m);

  std::string raw = voxcut::testing::slurp(path);
  ASSERT_GE(raw.size(), 10u);
  EXPECT_EQ(raw.substr(0, 6), "\x93NUMPY");
  EXPECT_EQ(raw[6], 1);
  EXPECT_EQ(raw[7], 0);

  size_t header_len = static_cast<unsigned char>(raw[8]) |
                      (static_cast<unsigned char>(raw[9]) << 8);
  EXPECT_EQ((10 + header_len) % 64, 0u);
  EXPECT_EQ(raw[10 + header_len - 1], '\n');
  EXPECT_NE(raw.find("'descr': '<f4'"), std::string::npos);
  EXPECT_NE(raw.find("'shape': (2, 3)"), std::string::npos);
  EXPECT_EQ(raw.size(), 10 + header_len + 6 * sizeof(float));

  EXPECT_EQ(load_npy(path), m);
}

TEST(Npy, RejectsRaggedRowsAndForeignFiles) {
  TempDir dir;
  EXPECT_THROW(save_npy(dir.file("r.npy"), {{1.0f}, {1.0f, 2.0f}}),
               std::runtime_error);
  EXPECT_THROW(load_npy(dir.write("x.npy", "plain text")), std::runtime_error);
  EXPECT_THROW(load_npy(dir.file("missing.npy")), std::runtime_error);
}

TEST(Npy, TruncatedDataThrows) {
  TempDir dir;
  std::string path = dir.file("t.npy");
  save_npy(path, {{1.0f, 2.0f}, {3.0f, 4.0f}});
  std::string raw = voxcut::testing::slurp(path);
  dir.write("t.npy", raw.substr(0, raw.size() - 3));
  EXPECT_THROW(load_npy(path), std::runtime_error);
}

TEST(Cosine, BasicValues) {
  EXPECT_DOUBLE_EQ(cosine_similarity({1, 0}, {1, 0}), 1.0);
  EXPECT_NEAR(cosine_similarity({1, 0}, {0, 1}), 0.0, 1e-12);
  EXPECT_NEAR(cosine_similarity({1, 1}, {-1, -1}), -1.0, 1e-12);
  EXPECT_NEAR(cosine_similarity({1, 1}, {1, 0}), 1.0 / std::sqrt(2.0), 1e-9);
  EXPECT_DOUBLE_EQ(cosine_similarity({0, 0}, {1, 0}), 0.0);
}

TEST(Embeddings, CachePathReplacesMediaExtension) {
  EXPECT_EQ(embeddings_path("/data/talk.mp4"), "/data/talk.embeddings.npy");
}
