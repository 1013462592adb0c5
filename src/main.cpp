/**
 * @file main.cpp
 * @brief Entry point for the voxcut command-line tool
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing into RunOptions
 *
 *          - N-gram listing mode (--ngrams N)
 *
 *          - Search, composition and export through the Pipeline
 *
 * @note Semantic search needs an embedding provider, which the command-line
 *       build does not link; requesting it reports the capability as
 *       unavailable and exits non-zero.
 */

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#include "voxcut/config.hpp"
#include "voxcut/errors.hpp"
#include "voxcut/logging.hpp"
#include "voxcut/media_probe.hpp"
#include "voxcut/pipeline.hpp"
#include "voxcut/renderer.hpp"
#include "voxcut/search_engine.hpp"
#include "voxcut/transcript_store.hpp"

using namespace voxcut;

namespace {

void print_usage() {
  fmt::print(
      "Usage: voxcut --input FILE... --search QUERY... [options]\n"
      "\n"
      "  -i, --input FILE...        media files to search\n"
      "  -s, --search QUERY...      queries (any one may match)\n"
      "  -st, --search-type TYPE    sentence | fragment | mash | semantic\n"
      "  -o, --output PATH          output file (.mp4 .mp3 .m3u .mpv.edl .xml)\n"
      "  -p, --padding SECONDS      padding around each clip\n"
      "  -r, --resync SECONDS       shift every clip\n"
      "  -m, --max-clips N          keep at most N clips\n"
      "  -rd, --randomize           shuffle clips\n"
      "  -em, --exact-match         whole-word matching\n"
      "  -d, --demo                 print results, render nothing\n"
      "  -ec, --export-clips        one output file per clip\n"
      "  --write-vtt                write a WebVTT file beside the output\n"
      "  --prefer EXT               transcript extension to try first\n"
      "  --threshold T              semantic similarity threshold\n"
      "  --force-reindex            rebuild cached embeddings\n"
      "  --seed N                   seed for mash and randomize\n"
      "  -n, --ngrams N             list the most common N-grams and exit\n"
      "  --ignore WORD...           words excluded from --ngrams\n"
      "  -h, --help                 show this help\n");
}

/// "-x" / "--xyz", but not a negative number such as "-0.5".
bool is_flag(const std::string &arg) {
  return arg.size() > 1 && arg[0] == '-' &&
         !std::isdigit(static_cast<unsigned char>(arg[1])) && arg[1] != '.';
}

/// Collect values up to the next flag.
std::vector<std::string> take_values(int argc, char *argv[], int &i) {
  std::vector<std::string> values;
  while (i + 1 < argc && !is_flag(argv[i + 1])) {
    values.emplace_back(argv[++i]);
  }
  return values;
}

std::string take_value(int argc, char *argv[], int &i,
                       const std::string &flag) {
  if (i + 1 >= argc)
    throw std::invalid_argument("missing value for " + flag);
  return argv[++i];
}

bool all_audio(const std::vector<std::string> &files) {
  if (files.empty())
    return false;
  for (const auto &f : files) {
    if (media_type(f) != MediaType::Audio)
      return false;
  }
  return true;
}

} // namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    print_usage();
    return 1;
  }

  RunOptions options;
  std::string search_type = "sentence";
  bool output_given = false;
  bool seeded = false;
  uint32_t seed = 0;
  size_t ngram_size = 0;
  std::vector<std::string> ignored_words;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "-h" || arg == "--help") {
        print_usage();
        return 0;
      } else if (arg == "-i" || arg == "--input") {
        auto values = take_values(argc, argv, i);
        options.files.insert(options.files.end(), values.begin(), values.end());
      } else if (arg == "-s" || arg == "--search") {
        auto values = take_values(argc, argv, i);
        options.queries.insert(options.queries.end(), values.begin(),
                               values.end());
      } else if (arg == "-st" || arg == "--search-type") {
        search_type = take_value(argc, argv, i, arg);
      } else if (arg == "-o" || arg == "--output") {
        options.output = take_value(argc, argv, i, arg);
        output_given = true;
      } else if (arg == "-p" || arg == "--padding") {
        options.padding = std::stod(take_value(argc, argv, i, arg));
      } else if (arg == "-r" || arg == "--resync") {
        options.resync = std::stod(take_value(argc, argv, i, arg));
      } else if (arg == "-m" || arg == "--max-clips") {
        options.max_clips = std::stoi(take_value(argc, argv, i, arg));
      } else if (arg == "-rd" || arg == "--randomize") {
        options.randomize = true;
      } else if (arg == "-em" || arg == "--exact-match") {
        options.exact_match = true;
      } else if (arg == "-d" || arg == "--demo") {
        options.demo = true;
      } else if (arg == "-ec" || arg == "--export-clips") {
        options.export_clips = true;
      } else if (arg == "--write-vtt") {
        options.write_vtt = true;
      } else if (arg == "--prefer") {
        options.preferred_ext = take_value(argc, argv, i, arg);
      } else if (arg == "--threshold") {
        options.threshold = std::stod(take_value(argc, argv, i, arg));
      } else if (arg == "--force-reindex") {
        options.force_reindex = true;
      } else if (arg == "--seed") {
        seed = static_cast<uint32_t>(
            std::stoul(take_value(argc, argv, i, arg)));
        seeded = true;
      } else if (arg == "-n" || arg == "--ngrams") {
        ngram_size = std::stoul(take_value(argc, argv, i, arg));
      } else if (arg == "--ignore") {
        auto values = take_values(argc, argv, i);
        ignored_words.insert(ignored_words.end(), values.begin(), values.end());
      } else {
        LOG_ERROR("Unknown argument: {}", arg);
        print_usage();
        return 1;
      }
    }

    options.search_type = parse_search_type(search_type);
  } catch (const Error &e) {
    LOG_ERROR("{}", e.what());
    return 1;
  } catch (const std::exception &e) {
    LOG_ERROR("Invalid arguments: {}", e.what());
    return 1;
  }

  if (options.files.empty()) {
    LOG_ERROR("No input files given (--input)");
    return 1;
  }

  TranscriptCache cache;
  TranscriptStore store(cache);
  SearchEngine engine(store);
  if (seeded)
    engine.seed(seed);

  // **---- N-GRAM MODE ----**

  if (ngram_size > 0) {
    auto grams = engine.ngrams(options.files, ngram_size, ignored_words,
                               options.preferred_ext);
    auto counts = most_common(grams, 100);
    LOG_PHASE("Most common {}-grams ({} total)", ngram_size, grams.size());
    for (const auto &[gram, count] : counts) {
      fmt::print("{:>6}  {}\n", count, fmt::join(gram, " "));
    }
    return 0;
  }

  // **---- SEARCH & EXPORT ----**

  if (options.queries.empty()) {
    LOG_ERROR("No search queries given (--search)");
    return 1;
  }

  if (!output_given && all_audio(options.files)) {
    options.output = "supercut.mp3";
    LOG_INFO("Audio-only input; writing {}", options.output);
  }

  LOG_INFO("voxcut");
  LOG_INFO("Inputs: {}", options.files.size());
  LOG_INFO("Output: {}", options.output);

  FfmpegRenderer renderer;
  Pipeline pipeline(engine, renderer);

  try {
    RunResult result = pipeline.run(options);
    for (const auto &f : result.failures) {
      LOG_WARN("Skipped {}: {}", f.item, f.message);
    }
    if (result.status == RunStatus::Exported) {
      LOG_SUCCESS("Done: {} ({} clips)", result.output_file,
                  result.clips_count);
    }
  } catch (const Error &e) {
    LOG_ERROR("{}", e.what());
    return 1;
  } catch (const std::exception &e) {
    LOG_ERROR("Export failed: {}", e.what());
    return 1;
  }

#if ENABLE_TIMING
  TimingCollector::print_summary();
#endif

  return 0;
}
