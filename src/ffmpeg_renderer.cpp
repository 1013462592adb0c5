/**
 * @file ffmpeg_renderer.cpp
 * @brief FFmpeg execution implementation
 */

#include "voxcut/renderer.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <sys/syscall.h>
#include <unistd.h>

#include <fmt/core.h>

#include "voxcut/config.hpp"
#include "voxcut/logging.hpp"
#include "voxcut/media_probe.hpp"
#include "voxcut/system.hpp"

#ifndef MFD_CLOEXEC
#define MFD_CLOEXEC 0x0001U
#endif

namespace voxcut {

namespace {

/// Quote for /bin/sh: wrap in single quotes, escape embedded ones.
std::string shell_quote(const std::string &arg) {
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += '\'';
  return out;
}

/// ffconcat `file` directive with the path quoted for the concat demuxer.
std::string concat_file_line(const std::string &path) {
  std::string abs_path = std::filesystem::absolute(path).string();
  std::string quoted;
  for (char c : abs_path) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  return fmt::format("file '{}'\n", quoted);
}

/**
 * @class MemoryFile
 * @brief memfd holding a concat list; closed on destruction.
 */
class MemoryFile {
public:
  explicit MemoryFile(const char *name)
      : fd_(static_cast<int>(syscall(SYS_memfd_create, name, MFD_CLOEXEC))) {}
  ~MemoryFile() {
    if (fd_ != -1)
      close(fd_);
  }

  MemoryFile(const MemoryFile &) = delete;
  MemoryFile &operator=(const MemoryFile &) = delete;

  bool valid() const { return fd_ != -1; }

  bool write_all(const std::string &content) {
    size_t written = 0;
    while (written < content.size()) {
      ssize_t n =
          write(fd_, content.data() + written, content.size() - written);
      if (n <= 0)
        return false;
      written += static_cast<size_t>(n);
    }
    return true;
  }

  std::string proc_path() const {
    return fmt::format("/proc/{}/fd/{}", getpid(), fd_);
  }

private:
  int fd_;
};

} // namespace

double FfmpegRenderer::source_duration(const std::string &file) {
  auto it = durations_.find(file);
  if (it != durations_.end())
    return it->second;
  double duration = media_duration(file);
  durations_.emplace(file, duration);
  return duration;
}

int FfmpegRenderer::render(const Composition &clips, const std::string &output,
                           ExportStrategy strategy) {
  if (clips.empty()) {
    LOG_WARN("No clips to render for {}", output);
    return 0;
  }

  /// Build concat list
  std::string list_content = "ffconcat version 1.0\n";
  list_content.reserve(4096);

  size_t usable = 0;
  for (const auto &c : clips) {
    double start = std::max(0.0, c.start);
    double end = c.end;
    double limit = source_duration(c.file);
    if (limit > 0.0)
      end = std::min(end, limit);
    if (end <= start)
      continue;
    list_content += concat_file_line(c.file);
    list_content += fmt::format("inpoint {:.3f}\n", start);
    list_content += fmt::format("outpoint {:.3f}\n", end);
    ++usable;
  }

  if (usable == 0) {
    LOG_ERROR("All {} clips for {} are empty after clamping", clips.size(),
              output);
    return -1;
  }

  std::string codec_args;
  if (strategy == ExportStrategy::Video) {
    codec_args = fmt::format(
        "-c:v libx264 -preset {} -b:v {} -c:a aac -b:a {} "
        "-movflags +faststart",
        Config::preset(), Config::video_bitrate(), Config::audio_bitrate());
  } else {
    codec_args = fmt::format("-vn -b:a {}", Config::audio_bitrate());
  }

  return run_concat_list(list_content, codec_args, output);
}

int FfmpegRenderer::concat(const std::vector<std::string> &inputs,
                           const std::string &output, ExportStrategy strategy) {
  if (inputs.empty()) {
    LOG_WARN("No intermediates to concatenate for {}", output);
    return 0;
  }

  std::string list_content = "ffconcat version 1.0\n";
  for (const auto &input : inputs) {
    list_content += concat_file_line(input);
  }

  std::string codec_args = "-c copy";
  if (strategy == ExportStrategy::Video)
    codec_args += " -movflags +faststart";

  return run_concat_list(list_content, codec_args, output);
}

int FfmpegRenderer::run_concat_list(const std::string &list_content,
                                    const std::string &codec_args,
                                    const std::string &output) {
  /// Create memory file for concat list
  MemoryFile list("voxcut_concat_list");
  if (!list.valid()) {
    LOG_ERROR("Failed to create memory file!");
    return -1;
  }
  if (!list.write_all(list_content)) {
    LOG_ERROR("Failed to write to memory file");
    return -1;
  }

  ScopedFile scratch_log(output + ".ffmpeg.log");

  std::string cmd = fmt::format(
      "{} -y -hide_banner -loglevel error "
      "-f concat -safe 0 -protocol_whitelist file,pipe,fd -i {} "
      "{} -fflags +genpts -avoid_negative_ts make_zero {} 2> {}",
      shell_quote(Config::ffmpeg_bin()), shell_quote(list.proc_path()),
      codec_args, shell_quote(output), shell_quote(scratch_log.path()));

  LOG_INFO("[FFmpeg] Writing {}",
           std::filesystem::path(output).filename().string());

  int status = std::system(cmd.c_str());

  if (status != 0) {
    LOG_ERROR("FFmpeg failed with status {} for {}", status, output);
    try {
      std::string details = trim(read_text_file(scratch_log.path()));
      if (!details.empty())
        LOG_ERROR("FFmpeg output:\n{}", details);
    } catch (const std::exception &e) {
      LOG_WARN("No FFmpeg log available: {}", e.what());
    }
    return status;
  }

  return 0;
}

} // namespace voxcut
