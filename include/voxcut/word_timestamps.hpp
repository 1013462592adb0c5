/**
 * @file word_timestamps.hpp
 * @brief Word-level timing for transcripts with or without it
 */

#ifndef VOXCUT_WORD_TIMESTAMPS_HPP
#define VOXCUT_WORD_TIMESTAMPS_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace voxcut {

/**
 * @brief Flatten a transcript into a time-ordered word list.
 *
 * @details When every segment carries words they are returned unchanged.
 *          Otherwise each segment's content is split on whitespace and its
 *          duration is divided evenly: word i of n spans
 *          [start + i*d/n, start + (i+1)*d/n) with confidence 1.0.
 *
 * @param transcript Parsed segments
 * @param file Value written into Word::file (left as-is when empty)
 * @return Flat word list
 *
 * @note Synthesized timing is approximate and is logged once per call.
 */
std::vector<Word> word_timestamps(const Transcript &transcript,
                                  const std::string &file = {});

} // namespace voxcut

#endif // VOXCUT_WORD_TIMESTAMPS_HPP
