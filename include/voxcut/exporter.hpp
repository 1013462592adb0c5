/**
 * @file exporter.hpp
 * @brief Export planning, batched rendering and playlist writers
 *
 * @details The Exporter turns a Composition into files on disk:
 *
 *          - plan_output_strategy() picks video or audio output
 *
 *          - chunk() splits a composition into bounded batches
 *
 *          - export_supercut() renders batches one after another into
 *            `<output>.batch<i><ext>` and concatenates the ones that
 *            succeeded
 *
 *          - export_individual_clips() renders one file per clip
 *
 *          Playlist writers (M3U, mpv EDL, xmeml, WebVTT) need only file,
 *          start, end and content and never touch the renderer.
 *
 * @note Batches are strictly sequential: each render returns before the next
 *       starts, which bounds peak memory in the renderer.
 *
 * @attention FAILURE POLICY:
 *            - A failed batch or clip is logged and recorded in the report
 *            - ExportFailedError only when nothing at all was rendered
 *            - Intermediates and scratch logs are removed in every case
 */

#ifndef VOXCUT_EXPORTER_HPP
#define VOXCUT_EXPORTER_HPP

#include <string>
#include <vector>

#include "renderer.hpp"
#include "types.hpp"

namespace voxcut {

/**
 * @struct ExportReport
 * @brief Outcome of one export call.
 */
struct ExportReport {
  ExportStrategy strategy = ExportStrategy::Video;
  std::string output;                //< Final output (base name for clips)
  BatchSummary<std::string> batches; //< Rendered files / failed items
  double elapsed_sec = 0.0;          //< Wall-clock time of the export

  double success_fraction() const { return batches.success_fraction(); }
};

/**
 * @brief Choose video or audio output.
 *
 * @param composition Clips to export (their files decide the input kind)
 * @param output Requested output path
 * @return Video when any input is video and the output is not an audio
 *         extension; Audio otherwise
 *
 * @throws InvalidOutputFormatError for audio-only input with a video output
 *         extension
 */
ExportStrategy plan_output_strategy(const Composition &composition,
                                    const std::string &output);

/**
 * @brief Split into contiguous batches of at most `batch_size` clips.
 * @note batch_size 0 is treated as 1.
 */
std::vector<Composition> chunk(const Composition &composition,
                               size_t batch_size);

/**
 * @class Exporter
 * @brief Renders compositions through a Renderer with per-batch recovery.
 */
class Exporter {
public:
  /**
   * @param renderer Media backend
   * @param batch_size Clips per batch (defaults to Config::batch_size())
   */
  explicit Exporter(Renderer &renderer, size_t batch_size = 0);

  /**
   * @brief Render the whole composition into one file.
   * @throws InvalidOutputFormatError, ExportFailedError
   */
  ExportReport export_supercut(const Composition &composition,
                               const std::string &output);

  /**
   * @brief Render each clip into `<base>_<00000><ext>`.
   * @throws InvalidOutputFormatError, ExportFailedError
   */
  ExportReport export_individual_clips(const Composition &composition,
                                       const std::string &output);

  size_t batch_size() const { return batch_size_; }

  /// Print the per-batch outcome table.
  static void print_export_summary(const ExportReport &report);

private:
  Renderer &renderer_;
  size_t batch_size_;
};

// **---- Playlist / interchange writers ----**

/**
 * @brief VLC playlist with per-entry start/stop options.
 * @throws std::runtime_error on I/O failure
 */
void export_m3u(const Composition &composition, const std::string &path);

/// mpv EDL (`# mpv EDL v0`, one `path,start,length` per clip).
void export_mpv_edl(const Composition &composition, const std::string &path);

/// Final Cut Pro 7 XML (xmeml v5) sequence of clip items.
void export_xml(const Composition &composition, const std::string &path);

/// WebVTT subtitles on the output timeline.
void export_vtt(const Composition &composition, const std::string &path);

} // namespace voxcut

#endif // VOXCUT_EXPORTER_HPP
