/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          See config/voxcut.env for detailed documentation of each
 *          parameter.
 *
 */

#ifndef VOXCUT_CONFIG_HPP
#define VOXCUT_CONFIG_HPP

#include <cstdlib>
#include <string>

namespace voxcut {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

// **---- COMPOSITION ----**

/// Clips rendered per batch before intermediates are concatenated
inline int batch_size() {
  static int val = get_env_int("VOXCUT_BATCH_SIZE", 20);
  return val;
}

/// Default padding (seconds) for fragment search
inline double default_padding() {
  static double val = get_env_double("VOXCUT_DEFAULT_PADDING", 0.3);
  return val;
}

/**
 * @brief Default padding (seconds) for mash search
 * @note Kept tiny so neighbouring single-word clips do not overlap.
 */
inline double mash_padding() {
  static double val = get_env_double("VOXCUT_MASH_PADDING", 0.05);
  return val;
}

// **---- SEARCH ----**

/// Minimum cosine similarity for a semantic match
inline double semantic_threshold() {
  static double val = get_env_double("VOXCUT_SEMANTIC_THRESHOLD", 0.45);
  return val;
}

// **---- RENDERING ----**

/// ffmpeg binary used by FfmpegRenderer
inline const std::string &ffmpeg_bin() {
  static std::string val = get_env_string("VOXCUT_FFMPEG", "ffmpeg");
  return val;
}

inline const std::string &video_bitrate() {
  static std::string val = get_env_string("VOXCUT_VIDEO_BITRATE", "8000k");
  return val;
}

inline const std::string &audio_bitrate() {
  static std::string val = get_env_string("VOXCUT_AUDIO_BITRATE", "192k");
  return val;
}

/// x264 preset for video re-encoding
inline const std::string &preset() {
  static std::string val = get_env_string("VOXCUT_PRESET", "medium");
  return val;
}

} // namespace Config
} // namespace voxcut

#endif // VOXCUT_CONFIG_HPP
