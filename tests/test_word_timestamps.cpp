#include <gtest/gtest.h>

#include "voxcut/word_timestamps.hpp"

using namespace voxcut;

namespace {

Segment segment(double start, double end, const std::string &content) {
  Segment s;
  s.file = "clip.mp4";
  s.start = start;
  s.end = end;
  s.content = content;
  return s;
}

} // namespace

TEST(WordTimestamps, RealTimingIsFlattenedAndTagged) {
  Transcript t = {segment(0, 1, "a b"), segment(2, 3, "c")};
  t[0].words = {Word{"a", 0.0, 0.4, 0.9, ""}, Word{"b", 0.4, 1.0, 0.8, ""}};
  t[1].words = {Word{"c", 2.0, 3.0, 0.7, ""}};

  auto words = word_timestamps(t, "other.mp4");
  ASSERT_EQ(words.size(), 3u);
  EXPECT_EQ(words[1].word, "b");
  EXPECT_DOUBLE_EQ(words[1].start, 0.4);
  EXPECT_DOUBLE_EQ(words[1].confidence, 0.8);
  EXPECT_EQ(words[2].file, "other.mp4");
}

TEST(WordTimestamps, MissingTimingIsSpreadEvenly) {
  Transcript t = {segment(0, 3, "one two three"), segment(10, 11, "four")};

  auto words = word_timestamps(t);
  ASSERT_EQ(words.size(), 4u);
  EXPECT_DOUBLE_EQ(words[0].start, 0.0);
  EXPECT_DOUBLE_EQ(words[0].end, 1.0);
  EXPECT_DOUBLE_EQ(words[1].start, 1.0);
  EXPECT_DOUBLE_EQ(words[2].end, 3.0);
  EXPECT_EQ(words[3].word, "four");
  EXPECT_DOUBLE_EQ(words[3].start, 10.0);
  EXPECT_DOUBLE_EQ(words[3].end, 11.0);
  EXPECT_DOUBLE_EQ(words[3].confidence, 1.0);
  EXPECT_EQ(words[0].file, "clip.mp4");
}

TEST(WordTimestamps, PartialTimingFallsBackToSynthesis) {
  Transcript t = {segment(0, 2, "timed words"), segment(4, 6, "plain words")};
  t[0].words = {Word{"timed", 0.0, 0.2, 1.0, ""},
                Word{"words", 0.2, 2.0, 1.0, ""}};

  auto words = word_timestamps(t);
  ASSERT_EQ(words.size(), 4u);
  EXPECT_DOUBLE_EQ(words[0].end, 1.0);
  EXPECT_DOUBLE_EQ(words[2].start, 4.0);
}

TEST(WordTimestamps, EmptyContentYieldsNothing) {
  Transcript t = {segment(0, 1, "   ")};
  EXPECT_TRUE(word_timestamps(t).empty());
  EXPECT_TRUE(word_timestamps(Transcript{}).empty());
}
