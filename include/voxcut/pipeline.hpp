/**
 * @file pipeline.hpp
 * @brief Search-to-export orchestration
 *
 * @details The Pipeline class runs one complete invocation:
 *
 *          1. Search the input files
 *
 *          2. Resolve padding (explicit, else the strategy default)
 *
 *          3. Build the composition
 *
 *          4. Demo table, playlist / EDL / XML by output extension,
 *             individual clips, or a rendered supercut
 *
 *          5. Optional WebVTT side-car and the run summary
 */

#ifndef VOXCUT_PIPELINE_HPP
#define VOXCUT_PIPELINE_HPP

#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "exporter.hpp"
#include "renderer.hpp"
#include "search_engine.hpp"
#include "types.hpp"

namespace voxcut {

/**
 * @struct RunOptions
 * @brief Everything one run needs (the CLI maps its flags onto this).
 */
struct RunOptions {
  std::vector<std::string> files;
  std::vector<std::string> queries;
  SearchType search_type = SearchType::Sentence;
  std::string output = "supercut.mp4";
  std::optional<double> padding; //< Unset = strategy default
  double resync = 0.0;
  int max_clips = 0;
  bool randomize = false;
  bool exact_match = false;
  bool demo = false;         //< Print results only
  bool export_clips = false; //< One file per clip
  bool write_vtt = false;    //< `<output stem>.vtt` beside the output
  std::optional<std::string> preferred_ext;
  double threshold = Config::semantic_threshold();
  bool force_reindex = false;
};

enum class RunStatus { Exported, Demo, NoResults };

const char *to_string(RunStatus status);

/**
 * @struct RunResult
 * @brief Statistics of one run.
 */
struct RunResult {
  RunStatus status = RunStatus::NoResults;
  size_t clips_count = 0;
  double supercut_duration = 0.0; //< Sum of clip lengths (seconds)
  double original_duration = 0.0; //< Sum of probed source lengths
  double time_saved = 0.0;
  double efficiency_percent = 0.0;
  std::string output_file;            //< Empty for demo / no results
  std::optional<ExportReport> report; //< Set when rendering happened
  std::vector<ItemError> failures;    //< Files skipped during search
  Composition composition;
};

/**
 * @class Pipeline
 * @brief Runs search, composition and export for one set of options.
 */
class Pipeline {
public:
  Pipeline(SearchEngine &engine, Renderer &renderer)
      : engine_(engine), renderer_(renderer) {}

  /**
   * @brief Execute one run.
   * @throws InvalidOutputFormatError, ExportFailedError,
   *         CapabilityUnavailableError
   */
  RunResult run(const RunOptions &options);

  /// Tabulate a composition without rendering.
  static void print_demo_table(const Composition &composition);

  /// Print the duration summary of a finished run.
  static void print_run_summary(const RunResult &result);

private:
  SearchEngine &engine_;
  Renderer &renderer_;
};

} // namespace voxcut

#endif // VOXCUT_PIPELINE_HPP
