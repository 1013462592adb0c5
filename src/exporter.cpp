/**
 * @file exporter.cpp
 * @brief Export planning and batched rendering implementation
 *
 * @details Implements:
 *
 *          - Output strategy planning from input kinds and output extension
 *
 *          - Sequential batch rendering with per-batch error recovery
 *
 *          - Individual clip export
 *
 *          - Playlist and interchange file writers
 */

#include "voxcut/exporter.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>

#include <fmt/color.h>
#include <fmt/core.h>

#include "voxcut/config.hpp"
#include "voxcut/errors.hpp"
#include "voxcut/logging.hpp"
#include "voxcut/media_probe.hpp"
#include "voxcut/system.hpp"
#include "voxcut/transcript_formats.hpp"

namespace voxcut {

namespace fs = std::filesystem;

namespace {

bool is_audio_extension(const std::string &ext) {
  const auto &exts = audio_extensions();
  return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

bool is_video_extension(const std::string &ext) {
  const auto &exts = video_extensions();
  return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

const char *intermediate_extension(ExportStrategy strategy) {
  return strategy == ExportStrategy::Video ? ".mp4" : ".mp3";
}

void write_file(const std::string &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out)
    throw std::runtime_error("cannot open " + path + " for writing");
  out << content;
  if (!out)
    throw std::runtime_error("write error on " + path);
}

std::string xml_escape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&apos;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

/// file:// URL with spaces percent-encoded.
std::string path_url(const std::string &path) {
  std::string url = "file://";
  for (char c : fs::absolute(path).string()) {
    if (c == ' ')
      url += "%20";
    else
      url += c;
  }
  return url;
}

} // namespace

// **---- Planning ----**

ExportStrategy plan_output_strategy(const Composition &composition,
                                    const std::string &output) {
  std::set<std::string> files;
  for (const auto &c : composition) {
    files.insert(c.file);
  }

  bool any_video = false;
  bool any_audio = false;
  for (const auto &f : files) {
    MediaType type = media_type(f);
    any_video = any_video || type == MediaType::Video;
    any_audio = any_audio || type == MediaType::Audio;
  }

  std::string ext = lower_extension(output);

  if (!any_video && any_audio && is_video_extension(ext)) {
    throw InvalidOutputFormatError(fmt::format(
        "cannot produce video output {} from audio-only input; use an audio "
        "extension such as .mp3 or .wav",
        output));
  }
  if (any_video && !is_audio_extension(ext))
    return ExportStrategy::Video;
  if (any_audio || is_audio_extension(ext))
    return ExportStrategy::Audio;
  return ExportStrategy::Video;
}

std::vector<Composition> chunk(const Composition &composition,
                               size_t batch_size) {
  batch_size = std::max<size_t>(batch_size, 1);
  std::vector<Composition> batches;
  for (size_t i = 0; i < composition.size(); i += batch_size) {
    size_t end = std::min(i + batch_size, composition.size());
    batches.emplace_back(composition.begin() + static_cast<std::ptrdiff_t>(i),
                         composition.begin() +
                             static_cast<std::ptrdiff_t>(end));
  }
  return batches;
}

// **---- Exporter ----**

Exporter::Exporter(Renderer &renderer, size_t batch_size)
    : renderer_(renderer),
      batch_size_(batch_size > 0
                      ? batch_size
                      : static_cast<size_t>(std::max(1, Config::batch_size()))) {}

ExportReport Exporter::export_supercut(const Composition &composition,
                                       const std::string &output) {
  if (composition.empty())
    throw ExportFailedError("nothing to export: composition is empty");

  TIMER_START(export_supercut);
  auto export_start = std::chrono::high_resolution_clock::now();

  ExportReport report;
  report.output = output;
  report.strategy = plan_output_strategy(composition, output);

  LOG_PHASE("==================== EXPORT ====================");
  LOG_INFO("Output: {} ({})", output, to_string(report.strategy));
  LOG_INFO("Clips: {}", composition.size());

  if (composition.size() <= batch_size_) {
    /// Single batch: render straight to the output
    int status = 0;
    try {
      status = renderer_.render(composition, output, report.strategy);
    } catch (const std::exception &e) {
      throw ExportFailedError(
          fmt::format("rendering {} failed: {}", output, e.what()));
    }
    if (status != 0) {
      throw ExportFailedError(
          fmt::format("rendering {} failed with status {}", output, status));
    }
    report.batches.succeeded.push_back(output);
  } else {
    auto batches = chunk(composition, batch_size_);
    LOG_INFO("Batches: {} x {} clips", batches.size(), batch_size_);

    std::vector<ScopedFile> intermediates;
    intermediates.reserve(batches.size());

    for (size_t i = 0; i < batches.size(); ++i) {
      std::string batch_file = fmt::format(
          "{}.batch{}{}", output, i, intermediate_extension(report.strategy));
      intermediates.emplace_back(batch_file);

      LOG_INFO("[Batch {}/{}] Rendering {} clips", i + 1, batches.size(),
               batches[i].size());

      int status = 0;
      try {
        status = renderer_.render(batches[i], batch_file, report.strategy);
      } catch (const std::exception &e) {
        LOG_ERROR("[Batch {}/{}] {}", i + 1, batches.size(), e.what());
        report.batches.failed.push_back(ItemError{batch_file, e.what()});
        continue;
      }

      if (status != 0) {
        LOG_ERROR("[Batch {}/{}] Failed with status {}", i + 1, batches.size(),
                  status);
        report.batches.failed.push_back(
            ItemError{batch_file, fmt::format("renderer status {}", status)});
        continue;
      }
      report.batches.succeeded.push_back(batch_file);
    }

    if (report.batches.succeeded.empty()) {
      print_export_summary(report);
      throw ExportFailedError(fmt::format(
          "all {} batches failed for {}", batches.size(), output));
    }

    if (!report.batches.failed.empty()) {
      LOG_WARN("{} of {} batches failed; concatenating the rest",
               report.batches.failed.size(), batches.size());
    }

    LOG_INFO("Concatenating {} batches", report.batches.succeeded.size());
    int status =
        renderer_.concat(report.batches.succeeded, output, report.strategy);
    if (status != 0) {
      throw ExportFailedError(fmt::format(
          "concatenating batches into {} failed with status {}", output,
          status));
    }
  }

  auto export_end = std::chrono::high_resolution_clock::now();
  report.elapsed_sec =
      std::chrono::duration<double>(export_end - export_start).count();
  TIMER_END(export_supercut);

  print_export_summary(report);
  return report;
}

ExportReport Exporter::export_individual_clips(const Composition &composition,
                                               const std::string &output) {
  if (composition.empty())
    throw ExportFailedError("nothing to export: composition is empty");

  TIMER_START(export_clips);
  auto export_start = std::chrono::high_resolution_clock::now();

  ExportReport report;
  report.output = output;
  report.strategy = plan_output_strategy(composition, output);

  std::string ext = fs::path(output).extension().string();
  if (ext.empty() ||
      (report.strategy == ExportStrategy::Audio &&
       !is_audio_extension(lower_extension(output)))) {
    ext = intermediate_extension(report.strategy);
  }
  std::string base = replace_extension(output, "");

  LOG_PHASE("================ EXPORT CLIPS ================");
  LOG_INFO("Clips: {} -> {}_NNNNN{}", composition.size(), base, ext);

  for (size_t i = 0; i < composition.size(); ++i) {
    std::string clip_file = fmt::format("{}_{:05d}{}", base, i, ext);
    Composition single{composition[i]};

    int status = 0;
    try {
      status = renderer_.render(single, clip_file, report.strategy);
    } catch (const std::exception &e) {
      LOG_ERROR("[Clip {}] {}", i, e.what());
      report.batches.failed.push_back(ItemError{clip_file, e.what()});
      continue;
    }
    if (status != 0) {
      LOG_ERROR("[Clip {}] Failed with status {}", i, status);
      report.batches.failed.push_back(
          ItemError{clip_file, fmt::format("renderer status {}", status)});
      continue;
    }
    report.batches.succeeded.push_back(clip_file);
  }

  auto export_end = std::chrono::high_resolution_clock::now();
  report.elapsed_sec =
      std::chrono::duration<double>(export_end - export_start).count();
  TIMER_END(export_clips);

  print_export_summary(report);

  if (report.batches.succeeded.empty()) {
    throw ExportFailedError(
        fmt::format("all {} clips failed for {}", composition.size(), output));
  }
  return report;
}

void Exporter::print_export_summary(const ExportReport &report) {
  const auto &b = report.batches;

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================= EXPORT SUMMARY =================\n");
  fmt::print("{:<25} {:>25}\n", "Output:",
             fs::path(report.output).filename().string());
  fmt::print("{:<25} {:>25}\n", "Strategy:", to_string(report.strategy));
  fmt::print("{:<25} {:>25}\n", "Rendered:", b.succeeded.size());
  fmt::print("{:<25} {:>25}\n", "Failed:", b.failed.size());
  fmt::print("{:<25} {:>24.0f}%\n", "Success:", b.success_fraction() * 100.0);
  fmt::print("{:<25} {:>24.1f}s\n", "Elapsed:", report.elapsed_sec);
  fmt::print(fg(fmt::color::cyan),
             "==================================================\n");
  std::fflush(stdout);

  if (!b.failed.empty()) {
    fmt::print(fg(fmt::color::red), "\nFailed items:\n");
    for (const auto &f : b.failed) {
      fmt::print(fg(fmt::color::red), "  - {}: {}\n",
                 fs::path(f.item).filename().string(), f.message);
    }
    std::fflush(stdout);
  }
}

// **---- Playlist / interchange writers ----**

void export_m3u(const Composition &composition, const std::string &path) {
  std::string out = "#EXTM3U\n";
  for (const auto &c : composition) {
    out += "#EXTINF:\n";
    out += fmt::format("#EXTVLCOPT:start-time={}\n", c.start);
    out += fmt::format("#EXTVLCOPT:stop-time={}\n", c.end);
    out += c.file + "\n";
  }
  write_file(path, out);
  LOG_INFO("Playlist written to {}", path);
}

void export_mpv_edl(const Composition &composition, const std::string &path) {
  std::string out = "# mpv EDL v0\n";
  for (const auto &c : composition) {
    out += fmt::format("{},{},{}\n", fs::absolute(c.file).string(), c.start,
                       c.duration());
  }
  write_file(path, out);
  LOG_INFO("EDL written to {}", path);
}

void export_xml(const Composition &composition, const std::string &path) {
  constexpr int timebase = 30;
  auto frames = [](double seconds) {
    return static_cast<long>(std::lround(seconds * timebase));
  };

  long total_frames = 0;
  for (const auto &c : composition) {
    total_frames += frames(c.end) - frames(c.start);
  }

  std::string out;
  out += "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  out += "<!DOCTYPE xmeml>\n";
  out += "<xmeml version=\"5\">\n";
  out += "  <sequence>\n";
  out += "    <name>voxcut</name>\n";
  out += fmt::format("    <duration>{}</duration>\n", total_frames);
  out += fmt::format("    <rate><timebase>{}</timebase><ntsc>FALSE</ntsc>"
                     "</rate>\n",
                     timebase);
  out += "    <media>\n      <video>\n        <track>\n";

  long cursor = 0;
  for (size_t i = 0; i < composition.size(); ++i) {
    const auto &c = composition[i];
    long in = frames(c.start);
    long out_frame = frames(c.end);
    long length = out_frame - in;
    std::string name = fs::path(c.file).filename().string();

    out += fmt::format("          <clipitem id=\"clipitem-{}\">\n", i + 1);
    out += fmt::format("            <name>{}</name>\n", xml_escape(name));
    out += fmt::format("            <start>{}</start>\n", cursor);
    out += fmt::format("            <end>{}</end>\n", cursor + length);
    out += fmt::format("            <in>{}</in>\n", in);
    out += fmt::format("            <out>{}</out>\n", out_frame);
    out += fmt::format("            <file id=\"file-{}\">\n", i + 1);
    out += fmt::format("              <name>{}</name>\n", xml_escape(name));
    out += fmt::format("              <pathurl>{}</pathurl>\n",
                       xml_escape(path_url(c.file)));
    out += "            </file>\n";
    out += fmt::format("            <comments><mastercomment1>{}"
                       "</mastercomment1></comments>\n",
                       xml_escape(c.content));
    out += "          </clipitem>\n";
    cursor += length;
  }

  out += "        </track>\n      </video>\n    </media>\n";
  out += "  </sequence>\n</xmeml>\n";

  write_file(path, out);
  LOG_INFO("XML written to {}", path);
}

void export_vtt(const Composition &composition, const std::string &path) {
  write_file(path, render_vtt(composition));
  LOG_INFO("Subtitle file written to {}", path);
}

} // namespace voxcut
