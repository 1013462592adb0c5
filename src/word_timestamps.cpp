/**
 * @file word_timestamps.cpp
 * @brief Word timing flattening and synthesis implementation
 */

#include "voxcut/word_timestamps.hpp"

#include <algorithm>

#include "voxcut/logging.hpp"
#include "voxcut/system.hpp"

namespace voxcut {

std::vector<Word> word_timestamps(const Transcript &transcript,
                                  const std::string &file) {
  std::vector<Word> words;

  bool all_timed = std::all_of(transcript.begin(), transcript.end(),
                               [](const Segment &s) { return s.has_words(); });

  if (all_timed) {
    for (const auto &seg : transcript) {
      for (const auto &w : seg.words) {
        words.push_back(w);
        if (!file.empty())
          words.back().file = file;
      }
    }
    return words;
  }

  LOG_WARN("No word timing for {}; spreading words evenly across segments",
           file.empty() ? std::string("transcript") : file);

  for (const auto &seg : transcript) {
    auto tokens = split_whitespace(seg.content);
    if (tokens.empty())
      continue;

    double step = (seg.end - seg.start) / static_cast<double>(tokens.size());
    for (size_t i = 0; i < tokens.size(); ++i) {
      Word w;
      w.word = tokens[i];
      w.start = seg.start + static_cast<double>(i) * step;
      w.end = seg.start + static_cast<double>(i + 1) * step;
      w.confidence = 1.0;
      w.file = file.empty() ? seg.file : file;
      words.push_back(std::move(w));
    }
  }
  return words;
}

} // namespace voxcut
