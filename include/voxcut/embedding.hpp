/**
 * @file embedding.hpp
 * @brief Text embeddings for semantic search
 *
 * @details Provides:
 *
 *          - EmbeddingProvider: the boundary to an external text encoder
 *
 *          - NumPy .npy (v1.0, little-endian float32, C order) read/write
 *            for the per-media embedding cache `<stem>.embeddings.npy`
 *
 *          - EmbeddingIndex: loads cached segment embeddings or encodes and
 *            saves them, rebuilding when the cached row count no longer
 *            matches the transcript
 *
 * @attention THREAD MODEL:
 *            - EmbeddingIndex serializes rebuilds per media path.
 *            - The provider is called from whichever thread searches.
 */

#ifndef VOXCUT_EMBEDDING_HPP
#define VOXCUT_EMBEDDING_HPP

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace voxcut {

using Embedding = std::vector<float>;
using EmbeddingMatrix = std::vector<Embedding>;

/**
 * @class EmbeddingProvider
 * @brief Encodes texts into fixed-size vectors.
 */
class EmbeddingProvider {
public:
  virtual ~EmbeddingProvider() = default;

  /**
   * @brief Encode each text into one row.
   * @return One embedding per input, in input order
   */
  virtual EmbeddingMatrix encode(const std::vector<std::string> &texts) = 0;
};

// **---- .npy I/O ----**

/**
 * @brief Write a 2-D float32 matrix as a .npy v1.0 file.
 * @throws std::runtime_error on ragged rows or I/O failure
 */
void save_npy(const std::string &path, const EmbeddingMatrix &matrix);

/**
 * @brief Read a 2-D little-endian float32 .npy file.
 * @throws std::runtime_error on unsupported dtype, layout or truncated data
 */
EmbeddingMatrix load_npy(const std::string &path);

/// Cosine similarity; 0.0 when either vector has zero norm.
double cosine_similarity(const Embedding &a, const Embedding &b);

/// `<stem>.embeddings.npy` beside the media file.
std::string embeddings_path(const std::string &media_path);

/**
 * @class EmbeddingIndex
 * @brief Per-media segment embeddings backed by the .npy cache.
 */
class EmbeddingIndex {
public:
  explicit EmbeddingIndex(EmbeddingProvider &provider) : provider_(provider) {}

  /**
   * @brief Segment embeddings for one media file.
   *
   * @param media_path Media file the transcript belongs to
   * @param transcript Its parsed segments
   * @param force_reindex Ignore any cached matrix
   * @return One row per segment
   *
   * @throws std::runtime_error if the provider returns the wrong row count
   * @note A failure to write the cache is logged, not thrown.
   */
  EmbeddingMatrix segment_embeddings(const std::string &media_path,
                                     const Transcript &transcript,
                                     bool force_reindex);

  EmbeddingProvider &provider() { return provider_; }

private:
  EmbeddingProvider &provider_;

  std::mutex locks_mutex_; //< Guards path_locks_
  std::unordered_map<std::string, std::unique_ptr<std::mutex>> path_locks_;

  std::mutex &lock_for(const std::string &path);
};

} // namespace voxcut

#endif // VOXCUT_EMBEDDING_HPP
