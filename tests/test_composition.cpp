#include <algorithm>
#include <random>

#include <gtest/gtest.h>

#include "voxcut/composition.hpp"
#include "voxcut/config.hpp"

using namespace voxcut;

namespace {

Match clip(const std::string &file, double start, double end) {
  Match m;
  m.file = file;
  m.start = start;
  m.end = end;
  m.content = file;
  return m;
}

bool same_clips(const std::vector<Match> &a, const std::vector<Match> &b) {
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (a[i].file != b[i].file || a[i].start != b[i].start ||
        a[i].end != b[i].end)
      return false;
  }
  return true;
}

} // namespace

// **---- Overlap removal ----**

TEST(RemoveOverlaps, MergesSameFileNeighbours) {
  auto out = remove_overlaps({clip("a", 0, 2), clip("a", 1, 3)});
  ASSERT_EQ(out.size(), 1u);
  EXPECT_DOUBLE_EQ(out[0].start, 0.0);
  EXPECT_DOUBLE_EQ(out[0].end, 3.0);
}

TEST(RemoveOverlaps, TouchingClipsMerge) {
  auto out = remove_overlaps({clip("a", 0, 2), clip("a", 2, 4)});
  ASSERT_EQ(out.size(), 1u);
  EXPECT_DOUBLE_EQ(out[0].end, 4.0);
}

TEST(RemoveOverlaps, ContainedClipKeepsOuterEnd) {
  auto out = remove_overlaps({clip("a", 0, 10), clip("a", 2, 4)});
  ASSERT_EQ(out.size(), 1u);
  EXPECT_DOUBLE_EQ(out[0].end, 10.0);
}

TEST(RemoveOverlaps, DifferentFilesNeverMerge) {
  auto out = remove_overlaps({clip("a", 0, 2), clip("b", 1, 3)});
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].file, "a");
  EXPECT_EQ(out[1].file, "b");
}

TEST(RemoveOverlaps, OnlyComparesWithThePreviousEntry) {
  auto out =
      remove_overlaps({clip("a", 0, 2), clip("b", 1, 3), clip("a", 1.5, 4)});
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[2].file, "a");
  EXPECT_DOUBLE_EQ(out[2].start, 1.5);
}

TEST(RemoveOverlaps, SortsByStartStably) {
  auto out = remove_overlaps({clip("b", 5, 6), clip("a", 1, 2), clip("c", 5, 7)});
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0].file, "a");
  EXPECT_EQ(out[1].file, "b");
  EXPECT_EQ(out[2].file, "c");
}

TEST(RemoveOverlaps, Idempotent) {
  std::vector<Match> input = {clip("a", 0, 2),   clip("a", 1, 3),
                              clip("b", 2, 5),   clip("a", 2.5, 4),
                              clip("a", 10, 11), clip("b", 4, 6)};
  auto once = remove_overlaps(input);
  auto twice = remove_overlaps(once);
  EXPECT_TRUE(same_clips(once, twice));
  EXPECT_TRUE(remove_overlaps({}).empty());
}

// **---- Padding & resync ----**

TEST(PadAndSync, PadsBothSidesAndClampsAtZero) {
  std::vector<Match> input = {clip("a", 0.1, 1.0), clip("a", 5.0, 6.0)};
  auto out = pad_and_sync(input, 0.5);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_DOUBLE_EQ(out[0].start, 0.0);
  EXPECT_DOUBLE_EQ(out[0].end, 1.5);
  EXPECT_DOUBLE_EQ(out[1].start, 4.5);
  EXPECT_DOUBLE_EQ(out[1].end, 6.5);

  /// Inputs are left untouched
  EXPECT_DOUBLE_EQ(input[0].start, 0.1);
}

TEST(PadAndSync, ResyncShiftsBothEnds) {
  auto later = pad_and_sync({clip("a", 1.0, 2.0)}, 0.0, 0.25);
  EXPECT_DOUBLE_EQ(later[0].start, 1.25);
  EXPECT_DOUBLE_EQ(later[0].end, 2.25);

  auto earlier = pad_and_sync({clip("a", 1.0, 2.0)}, 0.0, -1.5);
  EXPECT_DOUBLE_EQ(earlier[0].start, 0.0);
  EXPECT_DOUBLE_EQ(earlier[0].end, 0.5);
}

TEST(PadAndSync, PaddingCanCreateOverlapsThatAreMerged) {
  auto out = pad_and_sync({clip("a", 1.0, 2.0), clip("a", 2.4, 3.0)}, 0.3);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_DOUBLE_EQ(out[0].start, 0.7);
  EXPECT_DOUBLE_EQ(out[0].end, 3.3);
}

TEST(PadAndSync, OutputIsOverlapFreePerFile) {
  std::vector<Match> input = {clip("a", 0, 1), clip("b", 0.5, 1.5),
                              clip("a", 1.1, 2), clip("a", 3, 3.2),
                              clip("b", 1.6, 2)};
  for (double pad : {0.0, 0.1, 0.5}) {
    for (double resync : {-0.5, 0.0, 0.5}) {
      auto out = pad_and_sync(input, pad, resync);
      for (size_t i = 1; i < out.size(); ++i) {
        if (out[i].file == out[i - 1].file) {
          EXPECT_LT(out[i - 1].end, out[i].start)
              << "pad=" << pad << " resync=" << resync;
        }
      }
      for (const auto &m : out) {
        EXPECT_GE(m.start, 0.0);
        EXPECT_GE(m.end, 0.0);
      }
    }
  }
}

// **---- Composition ----**

TEST(BuildComposition, MaxClipsTruncatesAfterMerging) {
  std::mt19937 rng(1);
  CompositionOptions options;
  options.max_clips = 2;

  auto out = build_composition({clip("a", 0, 1), clip("a", 0.5, 2),
                                clip("a", 5, 6), clip("a", 8, 9)},
                               options, rng);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_DOUBLE_EQ(out[0].end, 2.0);
  EXPECT_DOUBLE_EQ(out[1].start, 5.0);
}

TEST(BuildComposition, RandomizeShufflesTheMergedClips) {
  std::vector<Match> input;
  for (int i = 0; i < 20; ++i) {
    input.push_back(clip("a", i * 10.0, i * 10.0 + 1.0));
  }

  CompositionOptions options;
  options.randomize = true;

  std::mt19937 rng_a(99);
  std::mt19937 rng_b(99);
  auto a = build_composition(input, options, rng_a);
  auto b = build_composition(input, options, rng_b);
  ASSERT_EQ(a.size(), input.size());
  EXPECT_TRUE(same_clips(a, b));

  auto sorted = a;
  std::sort(sorted.begin(), sorted.end(),
            [](const Match &x, const Match &y) { return x.start < y.start; });
  EXPECT_TRUE(same_clips(sorted, input));
}

TEST(BuildComposition, DefaultPaddingPerSearchType) {
  EXPECT_DOUBLE_EQ(default_padding(SearchType::Sentence), 0.0);
  EXPECT_DOUBLE_EQ(default_padding(SearchType::Semantic), 0.0);
  EXPECT_DOUBLE_EQ(default_padding(SearchType::Fragment),
                   Config::default_padding());
  EXPECT_DOUBLE_EQ(default_padding(SearchType::Mash), Config::mash_padding());
}

TEST(BuildComposition, TotalDuration) {
  EXPECT_DOUBLE_EQ(total_duration({clip("a", 0, 1.5), clip("b", 3, 4)}), 2.5);
  EXPECT_DOUBLE_EQ(total_duration({}), 0.0);
}
