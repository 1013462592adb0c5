/**
 * @file media_probe.cpp
 * @brief Media kind detection and libavformat probing implementation
 */

#include "voxcut/media_probe.hpp"

#include <algorithm>
#include <filesystem>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
}

#include "voxcut/logging.hpp"
#include "voxcut/system.hpp"

namespace voxcut {

namespace {

/**
 * @class FormatContext
 * @brief Owns an opened AVFormatContext; closes it on destruction.
 */
class FormatContext {
public:
  FormatContext() = default;
  ~FormatContext() {
    if (ctx_)
      avformat_close_input(&ctx_);
  }

  FormatContext(const FormatContext &) = delete;
  FormatContext &operator=(const FormatContext &) = delete;

  AVFormatContext **out() { return &ctx_; }
  AVFormatContext *get() const { return ctx_; }

private:
  AVFormatContext *ctx_ = nullptr;
};

std::string av_error_string(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return std::string(buf);
}

bool contains(const std::vector<std::string> &exts, const std::string &ext) {
  return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

} // anonymous namespace

MediaType media_type_from_extension(const std::string &path) {
  auto ext = lower_extension(path);
  if (contains(video_extensions(), ext))
    return MediaType::Video;
  if (contains(audio_extensions(), ext))
    return MediaType::Audio;
  return MediaType::Unknown;
}

std::optional<MediaInfo> probe_media(const std::string &path) {
  FormatContext fmt_ctx;

  int err = avformat_open_input(fmt_ctx.out(), path.c_str(), nullptr, nullptr);
  if (err < 0) {
    LOG_ERROR("avformat_open_input failed for {}: {}", path,
              av_error_string(err));
    return std::nullopt;
  }

  err = avformat_find_stream_info(fmt_ctx.get(), nullptr);
  if (err < 0) {
    LOG_ERROR("avformat_find_stream_info failed for {}: {}", path,
              av_error_string(err));
    return std::nullopt;
  }

  MediaInfo info;
  info.has_video = av_find_best_stream(fmt_ctx.get(), AVMEDIA_TYPE_VIDEO, -1,
                                       -1, nullptr, 0) >= 0;
  info.has_audio = av_find_best_stream(fmt_ctx.get(), AVMEDIA_TYPE_AUDIO, -1,
                                       -1, nullptr, 0) >= 0;
  if (fmt_ctx.get()->duration != AV_NOPTS_VALUE && fmt_ctx.get()->duration > 0) {
    info.duration =
        static_cast<double>(fmt_ctx.get()->duration) / AV_TIME_BASE;
  }
  return info;
}

MediaType media_type(const std::string &path) {
  MediaType by_ext = media_type_from_extension(path);
  if (by_ext != MediaType::Unknown)
    return by_ext;

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec))
    return MediaType::Unknown;

  auto info = probe_media(path);
  if (!info)
    return MediaType::Unknown;
  if (info->has_video)
    return MediaType::Video;
  if (info->has_audio)
    return MediaType::Audio;
  return MediaType::Unknown;
}

double media_duration(const std::string &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec))
    return 0.0;
  auto info = probe_media(path);
  return info ? info->duration : 0.0;
}

} // namespace voxcut
