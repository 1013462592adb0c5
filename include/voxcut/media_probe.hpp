/**
 * @file media_probe.hpp
 * @brief Media kind detection and libavformat probing
 *
 * @details Media kind is decided from the file extension first. Files with
 *          an unrecognised extension are opened with libavformat and
 *          classified from their streams (any video stream means video).
 *
 * @attention THREAD MODEL:
 *            - Each probe opens its own AVFormatContext; probes may run
 *              concurrently.
 */

#ifndef VOXCUT_MEDIA_PROBE_HPP
#define VOXCUT_MEDIA_PROBE_HPP

#include <optional>
#include <string>

#include "types.hpp"

namespace voxcut {

/**
 * @struct MediaInfo
 * @brief Stream summary of a probed media file.
 */
struct MediaInfo {
  bool has_video = false; //< At least one video stream
  bool has_audio = false; //< At least one audio stream
  double duration = 0.0;  //< Container duration in seconds (0 if unknown)
};

/// Classify by extension only (no disk access).
MediaType media_type_from_extension(const std::string &path);

/**
 * @brief Open a file with libavformat and summarize its streams.
 * @return MediaInfo on success, std::nullopt if the file cannot be opened
 *         or has no stream info (the reason is logged)
 */
std::optional<MediaInfo> probe_media(const std::string &path);

/**
 * @brief Media kind of a file: extension first, then probe.
 * @return MediaType::Unknown if neither source decides
 */
MediaType media_type(const std::string &path);

/**
 * @brief Container duration of a media file.
 * @return Duration in seconds, or 0.0 if it cannot be determined
 */
double media_duration(const std::string &path);

} // namespace voxcut

#endif // VOXCUT_MEDIA_PROBE_HPP
