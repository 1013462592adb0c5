/**
 * @file search_engine.hpp
 * @brief Query matching against parsed transcripts
 *
 * @details The SearchEngine runs one of four strategies over a list of media
 *          files:
 *
 *          - SENTENCE: whole segments whose text matches a query (regex,
 *            case-insensitive)
 *
 *          - FRAGMENT: contiguous word runs matching a multi-word query,
 *            timed from word-level timestamps
 *
 *          - MASH: one randomly chosen occurrence of every query word,
 *            across all files
 *
 *          - SEMANTIC: segments whose embedding is close to the query
 *            embedding (needs an EmbeddingProvider)
 *
 *          Files without a usable transcript are skipped and reported in
 *          SearchResult::failures, so an empty match list with no failures
 *          means "no results", not "error".
 *
 * @note Randomness (mash) comes from an owned std::mt19937 that callers can
 *       seed for reproducible output.
 */

#ifndef VOXCUT_SEARCH_ENGINE_HPP
#define VOXCUT_SEARCH_ENGINE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "embedding.hpp"
#include "transcript_store.hpp"
#include "types.hpp"

namespace voxcut {

/**
 * @struct SearchOptions
 * @brief Per-call search parameters.
 */
struct SearchOptions {
  bool exact_match = false;   //< Whole-word boundaries (sentence, fragment)
  double threshold = Config::semantic_threshold(); //< Minimum cosine similarity
  bool force_reindex = false; //< Ignore cached embeddings (semantic)
  std::optional<std::string> preferred_ext; //< Transcript extension to try first
};

/**
 * @struct SearchResult
 * @brief Matches in result order plus files that could not be searched.
 */
struct SearchResult {
  std::vector<Match> matches;
  std::vector<ItemError> failures; //< Not-found and parse failures, per file

  bool empty() const { return matches.empty(); }
};

/// One n-gram: n consecutive words.
using NGram = std::vector<std::string>;

/**
 * @class SearchEngine
 * @brief Runs search strategies over transcripts served by a TranscriptStore.
 */
class SearchEngine {
public:
  /**
   * @param store Transcript source (and its cache)
   * @param embeddings Encoder for semantic search; nullptr disables it
   */
  explicit SearchEngine(TranscriptStore &store,
                        EmbeddingProvider *embeddings = nullptr);

  SearchEngine(TranscriptStore &store, EmbeddingProvider *embeddings,
               uint32_t seed);

  /**
   * @brief Search files for any of the queries.
   *
   * @param files Media file paths, searched in order
   * @param queries Independent query strings (OR'd)
   * @param type Strategy
   * @param options Strategy parameters
   * @return Matches in strategy order plus per-file failures
   *
   * @throws CapabilityUnavailableError for semantic search without a provider
   */
  SearchResult search(const std::vector<std::string> &files,
                      const std::vector<std::string> &queries, SearchType type,
                      const SearchOptions &options = {});

  /// @throws InvalidSearchTypeError for an unknown strategy name
  SearchResult search(const std::vector<std::string> &files,
                      const std::vector<std::string> &queries,
                      const std::string &type,
                      const SearchOptions &options = {});

  /**
   * @brief Consecutive n-grams of words across all files.
   *
   * @param files Media file paths
   * @param n Words per n-gram (>= 1)
   * @param ignored_words N-grams containing any of these (case-insensitive)
   *                      are dropped
   */
  std::vector<NGram> ngrams(const std::vector<std::string> &files, size_t n,
                            const std::vector<std::string> &ignored_words = {},
                            const std::optional<std::string> &preferred_ext = {});

  /// Reseed the generator used by mash search.
  void seed(uint32_t value) { rng_.seed(value); }

  std::mt19937 &rng() { return rng_; }

  bool has_embeddings() const { return index_ != nullptr; }

private:
  TranscriptStore &store_;
  std::unique_ptr<EmbeddingIndex> index_; //< Null without a provider
  std::mt19937 rng_;

  /**
   * @brief Load one file's transcript, recording a failure if unavailable.
   * @return Segments, or nullptr (failure appended to `result`)
   */
  std::shared_ptr<const Transcript> load(const std::string &file,
                                         const SearchOptions &options,
                                         SearchResult &result);

  void search_sentence(const std::vector<std::string> &files,
                       const std::vector<std::string> &queries,
                       const SearchOptions &options, SearchResult &result);

  void search_fragment(const std::vector<std::string> &files,
                       const std::vector<std::string> &queries,
                       const SearchOptions &options, SearchResult &result);

  void search_mash(const std::vector<std::string> &files,
                   const std::vector<std::string> &queries,
                   const SearchOptions &options, SearchResult &result);

  void search_semantic(const std::vector<std::string> &files,
                       const std::vector<std::string> &queries,
                       const SearchOptions &options, SearchResult &result);
};

/**
 * @brief Count n-grams and return them most frequent first.
 * @param limit Maximum entries returned (0 = all)
 * @note Equal counts keep first-occurrence order.
 */
std::vector<std::pair<NGram, size_t>>
most_common(const std::vector<NGram> &grams, size_t limit = 0);

/// Lowercase and strip `.?!,:"` (mash word comparison).
std::string normalize_word(const std::string &word);

} // namespace voxcut

#endif // VOXCUT_SEARCH_ENGINE_HPP
