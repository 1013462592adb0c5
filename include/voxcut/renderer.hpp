/**
 * @file renderer.hpp
 * @brief Rendering boundary and the ffmpeg-backed renderer
 *
 * @details The exporter never encodes media itself. It hands ordered clip
 *          lists to a Renderer:
 *
 *          - render(): cut and join clips into one output file
 *
 *          - concat(): join already-rendered intermediates
 *
 *          FfmpegRenderer writes an ffconcat list (file / inpoint /
 *          outpoint) into an in-memory file and runs the ffmpeg binary on
 *          it, one process at a time.
 */

#ifndef VOXCUT_RENDERER_HPP
#define VOXCUT_RENDERER_HPP

#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace voxcut {

/**
 * @class Renderer
 * @brief Produces media files from clip lists.
 * @note Both calls block until the output is complete.
 */
class Renderer {
public:
  virtual ~Renderer() = default;

  /**
   * @brief Cut `clips` from their source files and join them into `output`.
   * @return 0 on success, non-zero on error
   */
  virtual int render(const Composition &clips, const std::string &output,
                     ExportStrategy strategy) = 0;

  /**
   * @brief Join rendered files, in order, into `output`.
   * @return 0 on success, non-zero on error
   */
  virtual int concat(const std::vector<std::string> &inputs,
                     const std::string &output, ExportStrategy strategy) = 0;
};

/**
 * @class FfmpegRenderer
 * @brief Renderer driving the ffmpeg binary (Config::ffmpeg_bin()).
 *
 * @attention ENCODING:
 *            - video: libx264 at Config::video_bitrate() with
 *              Config::preset(), aac audio at Config::audio_bitrate()
 *            - audio: video dropped, codec chosen by output extension
 *            - concat: stream copy
 *
 * @note ffmpeg's stderr goes to `<output>.ffmpeg.log`, which is printed on
 *       failure and always removed.
 */
class FfmpegRenderer : public Renderer {
public:
  int render(const Composition &clips, const std::string &output,
             ExportStrategy strategy) override;

  int concat(const std::vector<std::string> &inputs, const std::string &output,
             ExportStrategy strategy) override;

private:
  std::unordered_map<std::string, double> durations_; //< Probed, per source

  /// Source duration (0 if unknown), probed once per file.
  double source_duration(const std::string &file);

  /**
   * @brief Run ffmpeg on an ffconcat list held in a memory file.
   * @param list_content ffconcat script
   * @param codec_args Encoder arguments placed before the output
   * @param output Output path
   * @return 0 on success, non-zero on error
   */
  int run_concat_list(const std::string &list_content,
                      const std::string &codec_args,
                      const std::string &output);
};

} // namespace voxcut

#endif // VOXCUT_RENDERER_HPP
