/**
 * @file composition.hpp
 * @brief Turning raw matches into a renderable composition
 *
 * @details Build order:
 *
 *          1. Pad & resync every match (on copies), clamping to >= 0
 *
 *          2. Merge same-file overlaps in one greedy pass over the
 *             start-sorted list
 *
 *          3. Optionally shuffle (after merging)
 *
 *          4. Optionally keep only the first max_clips entries
 */

#ifndef VOXCUT_COMPOSITION_HPP
#define VOXCUT_COMPOSITION_HPP

#include <random>
#include <vector>

#include "types.hpp"

namespace voxcut {

/**
 * @struct CompositionOptions
 * @brief Parameters for build_composition().
 */
struct CompositionOptions {
  double padding = 0.0;   //< Seconds added on both sides of every match
  double resync = 0.0;    //< Seconds shifted (negative = earlier)
  bool randomize = false; //< Shuffle after merging
  int max_clips = 0;      //< Keep at most this many (0 = all)
};

/**
 * @brief Merge overlapping same-file neighbours.
 *
 * @details Stable-sorts by start, then walks once: a match is folded into the
 *          previous output entry only when both share a file and
 *          previous.end >= current.start.
 *
 * @note Running it on its own output changes nothing.
 */
std::vector<Match> remove_overlaps(std::vector<Match> matches);

/**
 * @brief Pad, resync and clamp copies of the matches, then merge overlaps.
 */
std::vector<Match> pad_and_sync(const std::vector<Match> &matches,
                                double padding = 0.0, double resync = 0.0);

/**
 * @brief Full composition build.
 * @param rng Generator used when options.randomize is set
 */
Composition build_composition(const std::vector<Match> &matches,
                              const CompositionOptions &options,
                              std::mt19937 &rng);

/// Padding applied when the caller gives none (from Config).
double default_padding(SearchType type);

/// Sum of clip durations.
double total_duration(const Composition &composition);

} // namespace voxcut

#endif // VOXCUT_COMPOSITION_HPP
