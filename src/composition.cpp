/**
 * @file composition.cpp
 * @brief Composition building implementation
 */

#include "voxcut/composition.hpp"

#include <algorithm>

#include "voxcut/config.hpp"
#include "voxcut/logging.hpp"

namespace voxcut {

std::vector<Match> remove_overlaps(std::vector<Match> matches) {
  if (matches.empty())
    return matches;

  std::stable_sort(matches.begin(), matches.end(),
                   [](const Match &a, const Match &b) {
                     return a.start < b.start;
                   });

  std::vector<Match> out;
  out.reserve(matches.size());
  out.push_back(std::move(matches.front()));
  for (size_t i = 1; i < matches.size(); ++i) {
    Match &prev = out.back();
    Match &cur = matches[i];
    if (cur.file == prev.file && prev.end >= cur.start) {
      prev.end = std::max(prev.end, cur.end);
    } else {
      out.push_back(std::move(cur));
    }
  }
  return out;
}

std::vector<Match> pad_and_sync(const std::vector<Match> &matches,
                                double padding, double resync) {
  std::vector<Match> adjusted;
  adjusted.reserve(matches.size());
  for (const auto &m : matches) {
    Match copy = m;
    copy.start = std::max(0.0, copy.start - padding + resync);
    copy.end = std::max(0.0, copy.end + padding + resync);
    adjusted.push_back(std::move(copy));
  }
  return remove_overlaps(std::move(adjusted));
}

Composition build_composition(const std::vector<Match> &matches,
                              const CompositionOptions &options,
                              std::mt19937 &rng) {
  Composition composition =
      pad_and_sync(matches, options.padding, options.resync);

  if (composition.size() < matches.size()) {
    LOG_INFO("Merged {} matches into {} clips", matches.size(),
             composition.size());
  }

  if (options.randomize)
    std::shuffle(composition.begin(), composition.end(), rng);

  if (options.max_clips > 0 &&
      composition.size() > static_cast<size_t>(options.max_clips)) {
    composition.resize(static_cast<size_t>(options.max_clips));
  }
  return composition;
}

double default_padding(SearchType type) {
  switch (type) {
  case SearchType::Fragment:
    return Config::default_padding();
  case SearchType::Mash:
    return Config::mash_padding();
  case SearchType::Sentence:
  case SearchType::Semantic:
    break;
  }
  return 0.0;
}

double total_duration(const Composition &composition) {
  double total = 0.0;
  for (const auto &c : composition) {
    total += c.duration();
  }
  return total;
}

} // namespace voxcut
