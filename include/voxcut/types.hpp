/**
 * @file types.hpp
 * @brief Core data types and constants for voxcut
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Word and Segment for parsed transcripts
 *
 *          - Match and Composition for search results and final cuts
 *
 *          - Closed enums for search strategies, transcript formats,
 *            media kinds and export strategies
 *
 *          - ItemError / BatchSummary for per-item error aggregation
 */

#ifndef VOXCUT_TYPES_HPP
#define VOXCUT_TYPES_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace voxcut {

// **----- CONSTANTS -----**

/// Transcript extensions in resolution priority order.
inline const std::vector<std::string> &transcript_extensions() {
  static const std::vector<std::string> exts = {".json", ".vtt", ".srt",
                                                ".transcript"};
  return exts;
}

inline const std::vector<std::string> &video_extensions() {
  static const std::vector<std::string> exts = {".mp4", ".mkv", ".avi",
                                                ".mov", ".webm", ".flv"};
  return exts;
}

inline const std::vector<std::string> &audio_extensions() {
  static const std::vector<std::string> exts = {".mp3",  ".wav", ".aac",
                                                ".flac", ".ogg", ".m4a"};
  return exts;
}

/// Suffix replacing the media extension for cached embedding matrices.
constexpr const char *EMBEDDINGS_SUFFIX = ".embeddings.npy";

// **----- DATA STRUCTURES -----**

/**
 * @struct Word
 * @brief A single timed word inside a transcript segment.
 */
struct Word {
  std::string word;        //< Word text, original casing and punctuation
  double start = 0.0;      //< Start time in seconds
  double end = 0.0;        //< End time in seconds
  double confidence = 1.0; //< Recognizer confidence in [0, 1]
  std::string file;        //< Source media (set during search only)
};

/**
 * @struct Segment
 * @brief One transcript line with timing and text.
 * @note `words` is empty when the source format has no word timing.
 */
struct Segment {
  std::string file;        //< Source media path
  double start = 0.0;      //< Start time in seconds
  double end = 0.0;        //< End time in seconds
  std::string content;     //< Line text
  std::vector<Word> words; //< Word-level timing, time ordered (optional)

  bool has_words() const { return !words.empty(); }
};

/**
 * @struct Match
 * @brief A Segment-shaped search hit.
 * @note Only semantic search sets `score`.
 */
struct Match {
  std::string file;
  double start = 0.0;
  double end = 0.0;
  std::string content;
  std::vector<Word> words;
  std::optional<double> score;

  double duration() const { return end - start; }
};

/// Ordered, overlap-free sequence of matches ready for rendering.
using Composition = std::vector<Match>;

using Transcript = std::vector<Segment>;

// **----- ENUMS -----**

enum class SearchType { Sentence, Fragment, Mash, Semantic };

/// Closed set of transcript formats. Unknown is reported, never guessed.
enum class TranscriptFormat { Json, Vtt, Srt, Sphinx, Unknown };

enum class MediaType { Video, Audio, Unknown };

enum class ExportStrategy { Video, Audio };

/**
 * @brief Parse a search type name ("sentence", "fragment", "mash",
 *        "semantic"), case-insensitive.
 * @throws InvalidSearchTypeError for anything else
 */
SearchType parse_search_type(const std::string &name);

const char *to_string(SearchType type);
const char *to_string(TranscriptFormat format);
const char *to_string(MediaType type);
const char *to_string(ExportStrategy strategy);

// **----- ERROR AGGREGATION -----**

/**
 * @struct ItemError
 * @brief A failure tied to one item of a multi-item operation
 *        (a file during search, a batch or clip during export).
 */
struct ItemError {
  std::string item;    //< File path, batch name or clip name
  std::string message; //< Human readable reason
};

/**
 * @struct BatchSummary
 * @brief Per-item outcome of a multi-item operation.
 */
template <typename T> struct BatchSummary {
  std::vector<T> succeeded;
  std::vector<ItemError> failed;

  size_t total() const { return succeeded.size() + failed.size(); }

  /// Fraction of items that succeeded (1.0 for an empty run).
  double success_fraction() const {
    return total() == 0 ? 1.0
                        : static_cast<double>(succeeded.size()) /
                              static_cast<double>(total());
  }
};

} // namespace voxcut

#endif // VOXCUT_TYPES_HPP
