/**
 * @file pipeline.cpp
 * @brief Search-to-export orchestration implementation
 */

#include "voxcut/pipeline.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <set>

#include <fmt/color.h>
#include <fmt/core.h>
#include <fmt/format.h>

#include "voxcut/composition.hpp"
#include "voxcut/logging.hpp"
#include "voxcut/media_probe.hpp"
#include "voxcut/system.hpp"

namespace voxcut {

namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string &text, const std::string &suffix) {
  return text.size() >= suffix.size() &&
         to_lower(text.substr(text.size() - suffix.size())) == suffix;
}

} // namespace

const char *to_string(RunStatus status) {
  switch (status) {
  case RunStatus::Exported:
    return "exported";
  case RunStatus::Demo:
    return "demo";
  case RunStatus::NoResults:
    return "no_results";
  }
  return "unknown";
}

RunResult Pipeline::run(const RunOptions &options) {
  RunResult result;

  // **---- Search ----**

  LOG_PHASE("Searching {} files for {} queries ({})", options.files.size(),
            options.queries.size(), to_string(options.search_type));

  SearchOptions search_options;
  search_options.exact_match = options.exact_match;
  search_options.threshold = options.threshold;
  search_options.force_reindex = options.force_reindex;
  search_options.preferred_ext = options.preferred_ext;

  SearchResult found = engine_.search(options.files, options.queries,
                                      options.search_type, search_options);
  result.failures = found.failures;

  if (found.empty()) {
    LOG_WARN("No results found for: {}", fmt::join(options.queries, " "));
    return result;
  }

  // **---- Composition ----**

  CompositionOptions comp;
  comp.padding = options.padding ? *options.padding
                                 : default_padding(options.search_type);
  comp.resync = options.resync;
  comp.randomize = options.randomize;
  comp.max_clips = options.max_clips;

  result.composition = build_composition(found.matches, comp, engine_.rng());
  result.clips_count = result.composition.size();
  result.supercut_duration = total_duration(result.composition);

  if (options.demo) {
    print_demo_table(result.composition);
    result.status = RunStatus::Demo;
    return result;
  }

  // **---- Export ----**

  std::error_code ec;
  fs::path out_dir = fs::absolute(options.output).parent_path();
  fs::create_directories(out_dir, ec);
  if (ec) {
    LOG_WARN("Could not create output directory {}: {}", out_dir.string(),
             ec.message());
  }

  const std::string &output = options.output;
  Exporter exporter(renderer_);

  if (options.export_clips) {
    result.report = exporter.export_individual_clips(result.composition, output);
  } else if (ends_with(output, ".m3u")) {
    export_m3u(result.composition, output);
  } else if (ends_with(output, ".mpv.edl")) {
    export_mpv_edl(result.composition, output);
  } else if (ends_with(output, ".xml")) {
    export_xml(result.composition, output);
  } else {
    result.report = exporter.export_supercut(result.composition, output);
  }

  if (options.write_vtt) {
    std::string vtt_path = replace_extension(output, ".vtt");
    export_vtt(result.composition, vtt_path);
  }

  // **---- Statistics ----**

  std::set<std::string> sources;
  for (const auto &c : result.composition) {
    sources.insert(c.file);
  }
  for (const auto &f : sources) {
    result.original_duration += media_duration(f);
  }

  result.time_saved =
      std::max(0.0, result.original_duration - result.supercut_duration);
  result.efficiency_percent =
      result.original_duration > 0
          ? result.time_saved / result.original_duration * 100.0
          : 0.0;
  result.output_file = output;
  result.status = RunStatus::Exported;

  print_run_summary(result);
  return result;
}

// **---- Demo Table ----**

void Pipeline::print_demo_table(const Composition &composition) {
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan), "Search Results ({} segments)\n",
             composition.size());
  fmt::print("{:<24} {:>9} {:>9}  {}\n", "File", "Start", "End", "Content");
  for (const auto &c : composition) {
    fmt::print("{:<24} {:>8.2f}s {:>8.2f}s  {}\n",
               fs::path(c.file).filename().string(), c.start, c.end,
               c.content);
  }
  fmt::print("{:<24} {:>18.2f}s\n", "Total:", total_duration(composition));
  std::fflush(stdout);
}

// **---- Run Summary ----**

void Pipeline::print_run_summary(const RunResult &result) {
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "=================== RUN SUMMARY ====================\n");
  fmt::print("{:<20} {:>15}\n", "Clips:", result.clips_count);
  fmt::print("{:<20} {:>15}\n", "Original:",
             format_time(result.original_duration));
  fmt::print("{:<20} {:>15}\n", "Supercut:",
             format_time(result.supercut_duration));
  fmt::print("{:<20} {:>15}\n", "Saved:", format_time(result.time_saved));
  fmt::print("{:<20} {:>14}%\n", "Efficiency:",
             static_cast<int>(result.efficiency_percent));
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

} // namespace voxcut
