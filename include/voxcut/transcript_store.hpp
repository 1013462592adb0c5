/**
 * @file transcript_store.hpp
 * @brief Transcript discovery, parsing and caching
 *
 * @details TranscriptStore maps a media file to its transcript and returns
 *          the parsed segments:
 *
 *          1. find_transcript() resolves the transcript path beside the media
 *             (exact stem, then fuzzy prefix, then a last-resort regex)
 *
 *          2. parse_transcript() reads and parses it, or serves the parse
 *             from the TranscriptCache while the file's mtime is unchanged
 *
 * @attention THREAD MODEL:
 *            - TranscriptCache is guarded by a reader/writer lock, so several
 *              threads may search through one store.
 *            - Cached transcripts are shared and immutable.
 */

#ifndef VOXCUT_TRANSCRIPT_STORE_HPP
#define VOXCUT_TRANSCRIPT_STORE_HPP

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "types.hpp"

namespace voxcut {

/**
 * @class TranscriptCache
 * @brief Parsed transcripts keyed by transcript path and source mtime.
 */
class TranscriptCache {
public:
  using clock_time = std::filesystem::file_time_type;

  /**
   * @brief Look up a parse.
   * @return The cached transcript if present and recorded with `mtime`,
   *         nullptr otherwise
   */
  std::shared_ptr<const Transcript> get(const std::string &path,
                                        clock_time mtime) const;

  void put(const std::string &path, clock_time mtime,
           std::shared_ptr<const Transcript> transcript);

  /// Drop one entry (no-op if absent).
  void invalidate(const std::string &path);

  void clear();

  size_t size() const;
  size_t hits() const { return hits_.load(); }
  size_t misses() const { return misses_.load(); }

private:
  struct Entry {
    std::shared_ptr<const Transcript> transcript;
    clock_time mtime;
  };

  mutable std::shared_mutex mutex_;               //< Guards entries_
  std::unordered_map<std::string, Entry> entries_; //< path -> parse
  mutable std::atomic<size_t> hits_{0};
  mutable std::atomic<size_t> misses_{0};
};

/**
 * @struct LoadResult
 * @brief Outcome of loading one media file's transcript.
 * @note Exactly one of `transcript` and `error` is set.
 */
struct LoadResult {
  std::shared_ptr<const Transcript> transcript;
  std::optional<ItemError> error;

  bool ok() const { return transcript != nullptr; }
};

/**
 * @class TranscriptStore
 * @brief Resolves, parses and caches transcripts for media files.
 */
class TranscriptStore {
public:
  explicit TranscriptStore(TranscriptCache &cache) : cache_(cache) {}

  /**
   * @brief Locate the transcript for a media file.
   *
   * @param media_path Path to the video or audio file
   * @param preferred_ext Extension tried before the default priority list
   *                      (with or without the leading dot)
   * @return Transcript path, or std::nullopt if none was found
   */
  std::optional<std::string>
  find_transcript(const std::string &media_path,
                  const std::optional<std::string> &preferred_ext = {}) const;

  /**
   * @brief Resolve and parse a transcript, reporting failures.
   * @note Never throws for missing or malformed transcripts.
   */
  LoadResult
  load_transcript(const std::string &media_path,
                  const std::optional<std::string> &preferred_ext = {});

  /**
   * @brief Resolve and parse a transcript.
   * @return Parsed segments, or nullptr if not found or unparseable (logged)
   */
  std::shared_ptr<const Transcript>
  parse_transcript(const std::string &media_path,
                   const std::optional<std::string> &preferred_ext = {});

  /// Forget the cached parse of a transcript file.
  void invalidate(const std::string &transcript_path) {
    cache_.invalidate(transcript_path);
  }

  TranscriptCache &cache() { return cache_; }

private:
  TranscriptCache &cache_;
};

} // namespace voxcut

#endif // VOXCUT_TRANSCRIPT_STORE_HPP
