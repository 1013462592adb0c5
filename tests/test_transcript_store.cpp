#include <chrono>
#include <filesystem>

#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "voxcut/transcript_store.hpp"

using namespace voxcut;
using voxcut::testing::TempDir;

namespace fs = std::filesystem;

namespace {

const char *ONE_SEGMENT_JSON = R"([{"content": "json line", "start": 1, "end": 2}])";

const char *ONE_CUE_SRT = "1\n00:00:01,000 --> 00:00:02,000\nsrt line\n";

} // namespace

class TranscriptStoreTest : public ::testing::Test {
protected:
  TempDir dir;
  TranscriptCache cache;
  TranscriptStore store{cache};

  std::string media(const std::string &name = "video.mp4") {
    return dir.write(name, "not really media");
  }
};

// **---- Resolution ----**

TEST_F(TranscriptStoreTest, ExactSiblingFollowsPriorityOrder) {
  auto video = media();
  dir.write("video.srt", ONE_CUE_SRT);
  dir.write("video.json", ONE_SEGMENT_JSON);

  auto found = store.find_transcript(video);
  ASSERT_TRUE(found);
  EXPECT_EQ(fs::path(*found).filename().string(), "video.json");
}

TEST_F(TranscriptStoreTest, PreferredExtensionIsTriedFirst) {
  auto video = media();
  dir.write("video.srt", ONE_CUE_SRT);
  dir.write("video.json", ONE_SEGMENT_JSON);

  auto dotted = store.find_transcript(video, std::string(".srt"));
  auto bare = store.find_transcript(video, std::string("SRT"));
  ASSERT_TRUE(dotted);
  ASSERT_TRUE(bare);
  EXPECT_EQ(fs::path(*dotted).filename().string(), "video.srt");
  EXPECT_EQ(*bare, *dotted);
}

TEST_F(TranscriptStoreTest, FuzzyMatchFindsLanguageSuffixedFile) {
  auto video = media();
  dir.write("video.en.srt", ONE_CUE_SRT);

  auto found = store.find_transcript(video);
  ASSERT_TRUE(found);
  EXPECT_EQ(fs::path(*found).filename().string(), "video.en.srt");
}

TEST_F(TranscriptStoreTest, RegexFallbackDoesNotReturnTheMediaItself) {
  auto video = media();
  dir.write("video-transcript", "whatever");

  auto found = store.find_transcript(video);
  ASSERT_TRUE(found);
  EXPECT_EQ(fs::path(*found).filename().string(), "video-transcript");

  auto loaded = store.load_transcript(video);
  EXPECT_FALSE(loaded.ok());
  ASSERT_TRUE(loaded.error);
  EXPECT_NE(loaded.error->message.find("unsupported transcript format"),
            std::string::npos);
}

TEST_F(TranscriptStoreTest, MissingTranscriptOrDirectory) {
  auto video = media();
  EXPECT_FALSE(store.find_transcript(video));
  EXPECT_FALSE(store.find_transcript(dir.file("nowhere/video.mp4")));

  auto loaded = store.load_transcript(video);
  EXPECT_FALSE(loaded.ok());
  ASSERT_TRUE(loaded.error);
  EXPECT_EQ(loaded.error->item, video);
  EXPECT_EQ(store.parse_transcript(video), nullptr);
}

// **---- Parsing & caching ----**

TEST_F(TranscriptStoreTest, SegmentsCarryTheMediaPath) {
  auto video = media();
  dir.write("video.json", ONE_SEGMENT_JSON);

  auto t = store.parse_transcript(video);
  ASSERT_NE(t, nullptr);
  ASSERT_EQ(t->size(), 1u);
  EXPECT_EQ((*t)[0].file, video);
  EXPECT_EQ((*t)[0].content, "json line");
}

TEST_F(TranscriptStoreTest, SrtWithByteOrderMarkParses) {
  auto video = media();
  dir.write("video.srt", std::string("\xEF\xBB\xBF") + ONE_CUE_SRT);

  auto t = store.parse_transcript(video);
  ASSERT_NE(t, nullptr);
  ASSERT_EQ(t->size(), 1u);
  EXPECT_EQ((*t)[0].content, "srt line");
}

TEST_F(TranscriptStoreTest, RepeatedParseIsServedFromCache) {
  auto video = media();
  dir.write("video.json", ONE_SEGMENT_JSON);

  auto first = store.parse_transcript(video);
  auto second = store.parse_transcript(video);
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first, second);
  EXPECT_EQ(cache.misses(), 1u);
  EXPECT_EQ(cache.hits(), 1u);
  EXPECT_EQ(cache.size(), 1u);
}

TEST_F(TranscriptStoreTest, ChangedFileIsReparsed) {
  auto video = media();
  auto json = dir.write("video.json", ONE_SEGMENT_JSON);

  auto first = store.parse_transcript(video);
  ASSERT_NE(first, nullptr);
  auto old_mtime = fs::last_write_time(json);

  dir.write("video.json",
            R"([{"content": "edited", "start": 0, "end": 1},
                {"content": "more", "start": 1, "end": 2}])");
  fs::last_write_time(json, old_mtime + std::chrono::seconds(5));

  auto second = store.parse_transcript(video);
  ASSERT_NE(second, nullptr);
  ASSERT_EQ(second->size(), 2u);
  EXPECT_EQ((*second)[0].content, "edited");
  EXPECT_EQ(cache.misses(), 2u);
}

TEST_F(TranscriptStoreTest, InvalidateForcesReparse) {
  auto video = media();
  auto json = dir.write("video.json", ONE_SEGMENT_JSON);

  auto first = store.parse_transcript(video);
  store.invalidate(json);
  auto second = store.parse_transcript(video);

  ASSERT_NE(second, nullptr);
  EXPECT_NE(first, second);
  EXPECT_EQ(cache.hits(), 0u);
}

TEST_F(TranscriptStoreTest, MalformedTranscriptIsReportedNotThrown) {
  auto video = media();
  dir.write("video.json", "[{\"content\": ");

  LoadResult loaded;
  EXPECT_NO_THROW(loaded = store.load_transcript(video));
  EXPECT_FALSE(loaded.ok());
  ASSERT_TRUE(loaded.error);
  EXPECT_NE(loaded.error->message.find("json"), std::string::npos);
  EXPECT_EQ(store.parse_transcript(video), nullptr);
  EXPECT_EQ(cache.size(), 0u);
}
