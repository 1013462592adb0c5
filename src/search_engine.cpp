/**
 * @file search_engine.cpp
 * @brief Search strategies implementation
 *
 * @details Each strategy appends to a SearchResult in its own order:
 *
 *          - sentence: file order, then segment start
 *
 *          - fragment: file order, then query, then word position
 *
 *          - mash: query token order
 *
 *          - semantic: score descending, ties in query/file/segment order
 */

#include "voxcut/search_engine.hpp"

#include <algorithm>
#include <regex>
#include <unordered_map>
#include <unordered_set>

#include "voxcut/errors.hpp"
#include "voxcut/logging.hpp"
#include "voxcut/system.hpp"
#include "voxcut/word_timestamps.hpp"

namespace voxcut {

namespace {

const std::regex::flag_type ICASE =
    std::regex::ECMAScript | std::regex::icase;

/// Literal, optionally whole-word, case-insensitive pattern.
std::regex literal_regex(const std::string &text, bool exact_match) {
  std::string pattern = regex_escape(text);
  if (exact_match)
    pattern = "\\b" + pattern + "\\b";
  return std::regex(pattern, ICASE);
}

/// User pattern as a case-insensitive regex; exact_match and invalid
/// patterns fall back to the literal text.
std::regex query_regex(const std::string &query, bool exact_match) {
  if (exact_match)
    return literal_regex(query, true);
  try {
    return std::regex(query, ICASE);
  } catch (const std::regex_error &e) {
    LOG_WARN("Query '{}' is not a valid regex ({}); matching it literally",
             query, e.what());
    return literal_regex(query, false);
  }
}

Match match_from_segment(const std::string &file, const Segment &seg) {
  Match m;
  m.file = file;
  m.start = seg.start;
  m.end = seg.end;
  m.content = seg.content;
  m.words = seg.words;
  return m;
}

/// Whitespace-split every query into its tokens.
std::vector<std::string> query_tokens(const std::vector<std::string> &queries) {
  std::vector<std::string> tokens;
  for (const auto &q : queries) {
    for (auto &t : split_whitespace(q)) {
      tokens.push_back(std::move(t));
    }
  }
  return tokens;
}

std::string join(const NGram &gram) {
  std::string out;
  for (const auto &w : gram) {
    if (!out.empty())
      out += ' ';
    out += w;
  }
  return out;
}

} // namespace

std::string normalize_word(const std::string &word) {
  static const std::string punctuation = ".?!,:\"";
  std::string out;
  out.reserve(word.size());
  for (char c : word) {
    if (punctuation.find(c) == std::string::npos)
      out += c;
  }
  return to_lower(out);
}

// **---- Construction ----**

SearchEngine::SearchEngine(TranscriptStore &store,
                           EmbeddingProvider *embeddings)
    : store_(store), rng_(std::random_device{}()) {
  if (embeddings)
    index_ = std::make_unique<EmbeddingIndex>(*embeddings);
}

SearchEngine::SearchEngine(TranscriptStore &store,
                           EmbeddingProvider *embeddings, uint32_t seed)
    : store_(store), rng_(seed) {
  if (embeddings)
    index_ = std::make_unique<EmbeddingIndex>(*embeddings);
}

// **---- Dispatch ----**

SearchResult SearchEngine::search(const std::vector<std::string> &files,
                                  const std::vector<std::string> &queries,
                                  const std::string &type,
                                  const SearchOptions &options) {
  return search(files, queries, parse_search_type(type), options);
}

SearchResult SearchEngine::search(const std::vector<std::string> &files,
                                  const std::vector<std::string> &queries,
                                  SearchType type,
                                  const SearchOptions &options) {
  if (type == SearchType::Semantic && !index_) {
    throw CapabilityUnavailableError(
        "semantic search requires an embedding provider");
  }

  TIMER_START(search);

  SearchResult result;
  switch (type) {
  case SearchType::Sentence:
    search_sentence(files, queries, options, result);
    break;
  case SearchType::Fragment:
    search_fragment(files, queries, options, result);
    break;
  case SearchType::Mash:
    search_mash(files, queries, options, result);
    break;
  case SearchType::Semantic:
    search_semantic(files, queries, options, result);
    break;
  }

  TIMER_END(search);

  LOG_INFO("{} search: {} matches in {} files ({} skipped)", to_string(type),
           result.matches.size(), files.size(), result.failures.size());
  return result;
}

std::shared_ptr<const Transcript>
SearchEngine::load(const std::string &file, const SearchOptions &options,
                   SearchResult &result) {
  auto loaded = store_.load_transcript(file, options.preferred_ext);
  if (!loaded.ok()) {
    LOG_ERROR("Skipping {}: {}", file, loaded.error->message);
    result.failures.push_back(*loaded.error);
    return nullptr;
  }
  return loaded.transcript;
}

// **---- Sentence ----**

void SearchEngine::search_sentence(const std::vector<std::string> &files,
                                   const std::vector<std::string> &queries,
                                   const SearchOptions &options,
                                   SearchResult &result) {
  std::vector<std::regex> patterns;
  patterns.reserve(queries.size());
  for (const auto &q : queries) {
    patterns.push_back(query_regex(q, options.exact_match));
  }

  for (const auto &file : files) {
    auto transcript = load(file, options, result);
    if (!transcript)
      continue;

    std::vector<Match> file_matches;
    for (const auto &seg : *transcript) {
      bool hit = std::any_of(patterns.begin(), patterns.end(),
                             [&seg](const std::regex &re) {
                               return std::regex_search(seg.content, re);
                             });
      if (hit)
        file_matches.push_back(match_from_segment(file, seg));
    }

    std::stable_sort(file_matches.begin(), file_matches.end(),
                     [](const Match &a, const Match &b) {
                       return a.start < b.start;
                     });
    for (auto &m : file_matches) {
      result.matches.push_back(std::move(m));
    }
  }
}

// **---- Fragment ----**

void SearchEngine::search_fragment(const std::vector<std::string> &files,
                                   const std::vector<std::string> &queries,
                                   const SearchOptions &options,
                                   SearchResult &result) {
  /// Per query: one pattern per whitespace token
  std::vector<std::vector<std::regex>> query_patterns;
  for (const auto &q : queries) {
    std::vector<std::regex> patterns;
    for (const auto &token : split_whitespace(q)) {
      patterns.push_back(query_regex(token, options.exact_match));
    }
    if (!patterns.empty())
      query_patterns.push_back(std::move(patterns));
  }

  for (const auto &file : files) {
    auto transcript = load(file, options, result);
    if (!transcript)
      continue;

    auto words = word_timestamps(*transcript, file);
    if (words.empty())
      continue;

    for (const auto &patterns : query_patterns) {
      size_t len = patterns.size();
      if (len > words.size())
        continue;

      for (size_t i = 0; i + len <= words.size(); ++i) {
        bool hit = true;
        for (size_t j = 0; j < len && hit; ++j) {
          hit = std::regex_search(words[i + j].word, patterns[j]);
        }
        if (!hit)
          continue;

        Match m;
        m.file = file;
        m.start = words[i].start;
        m.end = words[i + len - 1].end;
        for (size_t j = 0; j < len; ++j) {
          if (j > 0)
            m.content += ' ';
          m.content += words[i + j].word;
          m.words.push_back(words[i + j]);
        }
        result.matches.push_back(std::move(m));
      }
    }
  }
}

// **---- Mash ----**

void SearchEngine::search_mash(const std::vector<std::string> &files,
                               const std::vector<std::string> &queries,
                               const SearchOptions &options,
                               SearchResult &result) {
  std::vector<Word> all_words;
  for (const auto &file : files) {
    auto transcript = load(file, options, result);
    if (!transcript)
      continue;
    auto words = word_timestamps(*transcript, file);
    all_words.insert(all_words.end(), std::make_move_iterator(words.begin()),
                     std::make_move_iterator(words.end()));
  }

  if (all_words.empty()) {
    LOG_ERROR("Could not extract any words from the provided files");
    return;
  }

  /// Index words by normalized text
  std::unordered_map<std::string, std::vector<size_t>> by_text;
  for (size_t i = 0; i < all_words.size(); ++i) {
    by_text[normalize_word(all_words[i].word)].push_back(i);
  }

  std::vector<const std::vector<size_t> *> occurrences;
  for (const auto &token : query_tokens(queries)) {
    std::string key = normalize_word(token);
    if (key.empty())
      continue;
    auto it = by_text.find(key);
    if (it == by_text.end()) {
      LOG_WARN("Mash: no occurrence of '{}' in {} words; nothing to compose",
               token, all_words.size());
      return;
    }
    occurrences.push_back(&it->second);
  }

  for (const auto *candidates : occurrences) {
    std::uniform_int_distribution<size_t> pick(0, candidates->size() - 1);
    const Word &w = all_words[(*candidates)[pick(rng_)]];

    Match m;
    m.file = w.file;
    m.start = w.start;
    m.end = w.end;
    m.content = w.word;
    m.words.push_back(w);
    result.matches.push_back(std::move(m));
  }
}

// **---- Semantic ----**

void SearchEngine::search_semantic(const std::vector<std::string> &files,
                                   const std::vector<std::string> &queries,
                                   const SearchOptions &options,
                                   SearchResult &result) {
  struct FileEmbeddings {
    std::string file;
    std::shared_ptr<const Transcript> transcript;
    EmbeddingMatrix rows;
  };

  if (queries.empty())
    return;

  EmbeddingMatrix query_rows = index_->provider().encode(queries);
  if (query_rows.size() != queries.size() || query_rows.front().empty()) {
    LOG_ERROR("Query embeddings have an invalid shape ({} rows for {} "
              "queries); check the search terms",
              query_rows.size(), queries.size());
    return;
  }
  const size_t dim = query_rows.front().size();

  std::vector<FileEmbeddings> indexed;
  for (const auto &file : files) {
    auto transcript = load(file, options, result);
    if (!transcript)
      continue;

    try {
      FileEmbeddings entry{file, transcript,
                           index_->segment_embeddings(file, *transcript,
                                                      options.force_reindex)};
      indexed.push_back(std::move(entry));
    } catch (const std::exception &e) {
      LOG_ERROR("Skipping {}: embedding failed: {}", file, e.what());
      result.failures.push_back(
          ItemError{file, std::string("embedding failed: ") + e.what()});
    }
  }

  for (const auto &entry : indexed) {
    for (const auto &row : entry.rows) {
      if (row.size() != dim) {
        LOG_ERROR("Embedding dimension mismatch for {}: segments have {}, "
                  "queries have {}; rebuild with --force-reindex",
                  entry.file, row.size(), dim);
        return;
      }
    }
  }

  std::vector<Match> scored;
  for (const auto &query_row : query_rows) {
    for (const auto &entry : indexed) {
      for (size_t i = 0; i < entry.rows.size(); ++i) {
        double score = cosine_similarity(query_row, entry.rows[i]);
        if (score < options.threshold)
          continue;
        Match m = match_from_segment(entry.file, (*entry.transcript)[i]);
        m.score = score;
        scored.push_back(std::move(m));
      }
    }
  }

  std::stable_sort(scored.begin(), scored.end(),
                   [](const Match &a, const Match &b) {
                     return a.score.value_or(0.0) > b.score.value_or(0.0);
                   });
  result.matches = std::move(scored);
}

// **---- N-grams ----**

std::vector<NGram>
SearchEngine::ngrams(const std::vector<std::string> &files, size_t n,
                     const std::vector<std::string> &ignored_words,
                     const std::optional<std::string> &preferred_ext) {
  static const std::regex separators(R"([.?!,:"]+\s*|\s+)");

  std::vector<NGram> grams;
  if (n == 0)
    return grams;

  std::vector<std::string> words;
  for (const auto &file : files) {
    auto transcript = store_.parse_transcript(file, preferred_ext);
    if (!transcript)
      continue;
    for (const auto &seg : *transcript) {
      if (seg.has_words()) {
        for (const auto &w : seg.words) {
          words.push_back(w.word);
        }
        continue;
      }
      for (std::sregex_token_iterator it(seg.content.begin(),
                                         seg.content.end(), separators, -1),
           end;
           it != end; ++it) {
        if (it->length() > 0)
          words.push_back(it->str());
      }
    }
  }

  std::unordered_set<std::string> ignored;
  for (const auto &w : ignored_words) {
    ignored.insert(to_lower(w));
  }

  for (size_t i = 0; i + n <= words.size(); ++i) {
    NGram gram(words.begin() + static_cast<std::ptrdiff_t>(i),
               words.begin() + static_cast<std::ptrdiff_t>(i + n));
    bool skip = std::any_of(gram.begin(), gram.end(),
                            [&ignored](const std::string &w) {
                              return ignored.count(to_lower(w)) > 0;
                            });
    if (!skip)
      grams.push_back(std::move(gram));
  }
  return grams;
}

std::vector<std::pair<NGram, size_t>>
most_common(const std::vector<NGram> &grams, size_t limit) {
  std::vector<std::pair<NGram, size_t>> counts;
  std::unordered_map<std::string, size_t> slot;
  for (const auto &gram : grams) {
    auto key = join(gram);
    auto it = slot.find(key);
    if (it == slot.end()) {
      slot.emplace(key, counts.size());
      counts.emplace_back(gram, 1);
    } else {
      ++counts[it->second].second;
    }
  }

  std::stable_sort(counts.begin(), counts.end(),
                   [](const auto &a, const auto &b) {
                     return a.second > b.second;
                   });
  if (limit > 0 && counts.size() > limit)
    counts.resize(limit);
  return counts;
}

} // namespace voxcut
