/**
 * @file system.hpp
 * @brief File, path, text and time utilities
 *
 * @details Provides:
 *
 *          - Time formatting for summaries and subtitle output
 *
 *          - Path helpers (lowercase extension, stem replacement)
 *
 *          - Whole-file reads with UTF-8 BOM removal
 *
 *          - ScopedFile, which removes a temporary file when it leaves scope
 *
 *          - Small text helpers shared by parsers and search (ASCII case
 *            folding, whitespace tokenizing, regex escaping)
 *
 * @note Case folding is ASCII-only. Multi-byte UTF-8 sequences pass through
 *       unchanged, so accented letters compare case-sensitively.
 */

#ifndef VOXCUT_SYSTEM_HPP
#define VOXCUT_SYSTEM_HPP

#include <string>
#include <utility>
#include <vector>

namespace voxcut {

// **---- Time Formatting ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/**
 * @brief Format seconds as a WebVTT timestamp (HH:MM:SS.mmm).
 */
std::string format_vtt_timestamp(double seconds);

// **---- Paths ----**

/// Lowercased final extension including the dot ("" if none).
std::string lower_extension(const std::string &path);

/**
 * @brief Replace the final extension of a path with a suffix.
 * @note "dir/video.mp4" + ".embeddings.npy" -> "dir/video.embeddings.npy"
 */
std::string replace_extension(const std::string &path,
                              const std::string &suffix);

/**
 * @brief Read an entire file into a string.
 * @throws std::runtime_error if the file cannot be opened or read
 * @note A leading UTF-8 BOM is removed.
 */
std::string read_text_file(const std::string &path);

/**
 * @class ScopedFile
 * @brief Removes the named file on destruction (missing files are ignored).
 */
class ScopedFile {
public:
  explicit ScopedFile(std::string path) : path_(std::move(path)) {}
  ~ScopedFile();

  ScopedFile(const ScopedFile &) = delete;
  ScopedFile &operator=(const ScopedFile &) = delete;
  ScopedFile(ScopedFile &&other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
  }

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

// **---- Text ----**

/// ASCII lowercase copy.
std::string to_lower(std::string text);

/// Trim ASCII whitespace at both ends.
std::string trim(const std::string &text);

/// Split on runs of whitespace, dropping empty tokens.
std::vector<std::string> split_whitespace(const std::string &text);

/// Escape every ECMAScript regex metacharacter.
std::string regex_escape(const std::string &text);

} // namespace voxcut

#endif // VOXCUT_SYSTEM_HPP
