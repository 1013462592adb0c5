/**
 * @file embedding.cpp
 * @brief Embedding cache and similarity implementation
 */

#include "voxcut/embedding.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <regex>
#include <stdexcept>

#include <fmt/core.h>

#include "voxcut/logging.hpp"
#include "voxcut/system.hpp"

namespace voxcut {

namespace fs = std::filesystem;

namespace {

constexpr char NPY_MAGIC[] = "\x93NUMPY";
constexpr size_t NPY_MAGIC_LEN = 6;
constexpr size_t NPY_ALIGN = 64;

} // namespace

// **---- .npy I/O ----**

void save_npy(const std::string &path, const EmbeddingMatrix &matrix) {
  size_t rows = matrix.size();
  size_t cols = rows ? matrix.front().size() : 0;
  for (const auto &row : matrix) {
    if (row.size() != cols)
      throw std::runtime_error("ragged embedding matrix for " + path);
  }

  std::string header = fmt::format(
      "{{'descr': '<f4', 'fortran_order': False, 'shape': ({}, {}), }}", rows,
      cols);
  /// magic(6) + version(2) + header_len(2) + header + '\n' is 64-aligned
  size_t preamble = NPY_MAGIC_LEN + 2 + 2;
  size_t total = preamble + header.size() + 1;
  size_t padded = ((total + NPY_ALIGN - 1) / NPY_ALIGN) * NPY_ALIGN;
  header.append(padded - total, ' ');
  header.push_back('\n');

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out)
    throw std::runtime_error("cannot open " + path + " for writing");

  auto header_len = static_cast<uint16_t>(header.size());
  unsigned char len_bytes[2] = {static_cast<unsigned char>(header_len & 0xFF),
                                static_cast<unsigned char>(header_len >> 8)};

  out.write(NPY_MAGIC, NPY_MAGIC_LEN);
  out.put(1);
  out.put(0);
  out.write(reinterpret_cast<const char *>(len_bytes), 2);
  out.write(header.data(), static_cast<std::streamsize>(header.size()));
  for (const auto &row : matrix) {
    out.write(reinterpret_cast<const char *>(row.data()),
              static_cast<std::streamsize>(row.size() * sizeof(float)));
  }
  if (!out)
    throw std::runtime_error("write error on " + path);
}

EmbeddingMatrix load_npy(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw std::runtime_error("cannot open " + path);

  char magic[NPY_MAGIC_LEN];
  unsigned char version[2];
  in.read(magic, NPY_MAGIC_LEN);
  in.read(reinterpret_cast<char *>(version), 2);
  if (!in || std::memcmp(magic, NPY_MAGIC, NPY_MAGIC_LEN) != 0)
    throw std::runtime_error(path + " is not a .npy file");

  size_t header_len = 0;
  if (version[0] == 1) {
    unsigned char b[2];
    in.read(reinterpret_cast<char *>(b), 2);
    header_len = static_cast<size_t>(b[0]) | (static_cast<size_t>(b[1]) << 8);
  } else if (version[0] == 2 || version[0] == 3) {
    unsigned char b[4];
    in.read(reinterpret_cast<char *>(b), 4);
    header_len = static_cast<size_t>(b[0]) | (static_cast<size_t>(b[1]) << 8) |
                 (static_cast<size_t>(b[2]) << 16) |
                 (static_cast<size_t>(b[3]) << 24);
  } else {
    throw std::runtime_error(
        fmt::format("{}: unsupported .npy version {}", path,
                    static_cast<int>(version[0])));
  }

  std::string header(header_len, '\0');
  in.read(&header[0], static_cast<std::streamsize>(header_len));
  if (!in)
    throw std::runtime_error(path + ": truncated .npy header");

  static const std::regex descr_re(R"('descr'\s*:\s*'([^']*)')");
  static const std::regex fortran_re(R"('fortran_order'\s*:\s*(True|False))");
  static const std::regex shape_re(R"('shape'\s*:\s*\(\s*(\d+)\s*,\s*(\d+)\s*,?\s*\))");

  std::smatch m;
  if (!std::regex_search(header, m, descr_re) || m[1].str() != "<f4")
    throw std::runtime_error(path + ": expected dtype '<f4'");
  if (!std::regex_search(header, m, fortran_re) || m[1].str() != "False")
    throw std::runtime_error(path + ": Fortran order is not supported");
  if (!std::regex_search(header, m, shape_re))
    throw std::runtime_error(path + ": expected a 2-D shape");

  size_t rows = std::stoul(m[1].str());
  size_t cols = std::stoul(m[2].str());

  EmbeddingMatrix matrix(rows, Embedding(cols));
  for (auto &row : matrix) {
    in.read(reinterpret_cast<char *>(row.data()),
            static_cast<std::streamsize>(cols * sizeof(float)));
    if (!in)
      throw std::runtime_error(path + ": truncated .npy data");
  }
  return matrix;
}

// **---- Similarity ----**

double cosine_similarity(const Embedding &a, const Embedding &b) {
  size_t n = std::min(a.size(), b.size());
  double dot = 0.0;
  double na = 0.0;
  double nb = 0.0;
  for (size_t i = 0; i < n; ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    na += static_cast<double>(a[i]) * a[i];
    nb += static_cast<double>(b[i]) * b[i];
  }
  if (na == 0.0 || nb == 0.0)
    return 0.0;
  return dot / (std::sqrt(na) * std::sqrt(nb));
}

std::string embeddings_path(const std::string &media_path) {
  return replace_extension(media_path, EMBEDDINGS_SUFFIX);
}

// **---- EmbeddingIndex ----**

std::mutex &EmbeddingIndex::lock_for(const std::string &path) {
  std::lock_guard<std::mutex> lock(locks_mutex_);
  auto &slot = path_locks_[path];
  if (!slot)
    slot = std::make_unique<std::mutex>();
  return *slot;
}

EmbeddingMatrix EmbeddingIndex::segment_embeddings(const std::string &media_path,
                                                   const Transcript &transcript,
                                                   bool force_reindex) {
  std::string cache_path = embeddings_path(media_path);
  std::lock_guard<std::mutex> lock(lock_for(cache_path));

  std::error_code ec;
  if (!force_reindex && fs::is_regular_file(cache_path, ec)) {
    try {
      EmbeddingMatrix cached = load_npy(cache_path);
      if (cached.size() == transcript.size())
        return cached;
      LOG_WARN("Embedding cache {} has {} rows for {} segments; rebuilding",
               cache_path, cached.size(), transcript.size());
    } catch (const std::exception &e) {
      LOG_WARN("Unreadable embedding cache {} ({}); rebuilding", cache_path,
               e.what());
    }
  }

  LOG_INFO("Encoding {} segments of {}", transcript.size(), media_path);

  std::vector<std::string> texts;
  texts.reserve(transcript.size());
  for (const auto &seg : transcript) {
    texts.push_back(seg.content);
  }

  EmbeddingMatrix matrix = provider_.encode(texts);
  if (matrix.size() != texts.size()) {
    throw std::runtime_error(
        fmt::format("embedding provider returned {} rows for {} texts",
                    matrix.size(), texts.size()));
  }

  try {
    save_npy(cache_path, matrix);
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to write embedding cache {}: {}", cache_path, e.what());
  }
  return matrix;
}

} // namespace voxcut
