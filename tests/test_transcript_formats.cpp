#include <stdexcept>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "voxcut/transcript_formats.hpp"

using namespace voxcut;

// **---- Timestamps ----**

TEST(ParseTimestamp, AcceptsCommaDotAndShortForms) {
  EXPECT_DOUBLE_EQ(parse_timestamp("00:00:01,500"), 1.5);
  EXPECT_DOUBLE_EQ(parse_timestamp("01:02:03.250"), 3723.25);
  EXPECT_DOUBLE_EQ(parse_timestamp("02:05.000"), 125.0);
  EXPECT_DOUBLE_EQ(parse_timestamp("  00:00:07  "), 7.0);
}

TEST(ParseTimestamp, RejectsGarbage) {
  EXPECT_THROW(parse_timestamp("abc"), std::invalid_argument);
  EXPECT_THROW(parse_timestamp("12"), std::invalid_argument);
  EXPECT_THROW(parse_timestamp(""), std::invalid_argument);
}

TEST(FormatForPath, ClosedSetByExtension) {
  EXPECT_EQ(format_for_path("a/b.JSON"), TranscriptFormat::Json);
  EXPECT_EQ(format_for_path("b.vtt"), TranscriptFormat::Vtt);
  EXPECT_EQ(format_for_path("b.en.srt"), TranscriptFormat::Srt);
  EXPECT_EQ(format_for_path("b.transcript"), TranscriptFormat::Sphinx);
  EXPECT_EQ(format_for_path("b.txt"), TranscriptFormat::Unknown);
  EXPECT_THROW(parse_as(TranscriptFormat::Unknown, "[]"),
               std::invalid_argument);
}

// **---- SRT ----**

TEST(ParseSrt, JoinsMultilineTextAndToleratesCrlf) {
  const std::string srt = "1\r\n"
                          "00:00:01,000 --> 00:00:02,500\r\n"
                          "Hello\r\n"
                          "there\r\n"
                          "\r\n"
                          "2\r\n"
                          "00:00:03.000 --> 00:00:04.000\r\n"
                          "Bye\r\n";
  auto t = parse_srt(srt);
  ASSERT_EQ(t.size(), 2u);
  EXPECT_EQ(t[0].content, "Hello there");
  EXPECT_DOUBLE_EQ(t[0].start, 1.0);
  EXPECT_DOUBLE_EQ(t[0].end, 2.5);
  EXPECT_FALSE(t[0].has_words());
  EXPECT_EQ(t[1].content, "Bye");
  EXPECT_DOUBLE_EQ(t[1].start, 3.0);
}

TEST(ParseSrt, MalformedTimingThrows) {
  EXPECT_THROW(parse_srt("1\nxx:yy --> 00:00:01,000\nhi\n"),
               std::invalid_argument);
}

// **---- WebVTT ----**

TEST(ParseVtt, InlineWordTagsGiveWordTiming) {
  const std::string vtt =
      "WEBVTT\n"
      "Kind: captions\n"
      "Language: en\n"
      "\n"
      "00:00:00.000 --> 00:00:02.000 align:start position:0%\n"
      "hello<00:00:00.500><c> world</c><00:00:01.000><c> again</c>\n"
      "\n"
      "00:00:02.000 --> 00:00:02.010 align:start position:0%\n"
      "hello world again\n";

  auto t = parse_vtt(vtt);
  ASSERT_EQ(t.size(), 1u);
  EXPECT_EQ(t[0].content, "hello world again");
  EXPECT_DOUBLE_EQ(t[0].start, 0.0);
  EXPECT_DOUBLE_EQ(t[0].end, 2.0);

  ASSERT_EQ(t[0].words.size(), 3u);
  EXPECT_EQ(t[0].words[0].word, "hello");
  EXPECT_DOUBLE_EQ(t[0].words[0].start, 0.0);
  EXPECT_DOUBLE_EQ(t[0].words[0].end, 0.5);
  EXPECT_EQ(t[0].words[1].word, "world");
  EXPECT_DOUBLE_EQ(t[0].words[1].start, 0.5);
  EXPECT_DOUBLE_EQ(t[0].words[1].end, 1.0);
  EXPECT_EQ(t[0].words[2].word, "again");
  EXPECT_DOUBLE_EQ(t[0].words[2].start, 1.0);
  EXPECT_DOUBLE_EQ(t[0].words[2].end, 2.0);
}

TEST(ParseVtt, RunWithSeveralWordsIsSpreadEvenly) {
  const std::string vtt = "WEBVTT\n\n"
                          "00:00:10.000 --> 00:00:14.000\n"
                          "one two<00:00:12.000> three four\n";
  auto t = parse_vtt(vtt);
  ASSERT_EQ(t.size(), 1u);
  ASSERT_EQ(t[0].words.size(), 4u);
  EXPECT_DOUBLE_EQ(t[0].words[0].start, 10.0);
  EXPECT_DOUBLE_EQ(t[0].words[0].end, 11.0);
  EXPECT_DOUBLE_EQ(t[0].words[1].start, 11.0);
  EXPECT_DOUBLE_EQ(t[0].words[1].end, 12.0);
  EXPECT_DOUBLE_EQ(t[0].words[2].start, 12.0);
  EXPECT_DOUBLE_EQ(t[0].words[3].end, 14.0);
}

TEST(ParseVtt, PlainCuesHaveNoWordTiming) {
  const std::string vtt = "WEBVTT\n"
                          "\n"
                          "1\n"
                          "00:00:01.000 --> 00:00:03.500\n"
                          "First line\n"
                          "continues here\n"
                          "\n"
                          "2\n"
                          "00:00:04.000 --> 00:00:05.000\n"
                          "Second\n";
  auto t = parse_vtt(vtt);
  ASSERT_EQ(t.size(), 2u);
  EXPECT_EQ(t[0].content, "First line continues here");
  EXPECT_DOUBLE_EQ(t[0].start, 1.0);
  EXPECT_DOUBLE_EQ(t[0].end, 3.5);
  EXPECT_FALSE(t[0].has_words());
  EXPECT_EQ(t[1].content, "Second");
}

TEST(ParseVtt, CuesWithoutIdentifiersKeepEveryLine) {
  const std::string vtt = "WEBVTT\n"
                          "\n"
                          "00:00:01.000 --> 00:00:02.000\n"
                          "hello world\n"
                          "\n"
                          "00:00:03.000 --> 00:00:04.000\n"
                          "line one\n"
                          "line two\n"
                          "\n"
                          "NOTE reviewed\n"
                          "\n"
                          "00:00:05.000 --> 00:00:06.000\n"
                          "last\n";
  auto t = parse_vtt(vtt);
  ASSERT_EQ(t.size(), 3u);
  EXPECT_EQ(t[0].content, "hello world");
  EXPECT_DOUBLE_EQ(t[0].start, 1.0);
  EXPECT_EQ(t[1].content, "line one line two");
  EXPECT_DOUBLE_EQ(t[1].end, 4.0);
  EXPECT_EQ(t[2].content, "last");
}

// **---- JSON ----**

TEST(ParseJson, ConfidenceDefaultsToOne) {
  const std::string json = R"([
    {"content": "a b", "start": 1, "end": 2,
     "words": [{"word": "a", "start": 1.0, "end": 1.5},
               {"word": "b", "start": 1.5, "end": 2.0, "conf": 0.25}]},
    {"content": "plain", "start": 3, "end": 4}
  ])";
  auto t = parse_json(json);
  ASSERT_EQ(t.size(), 2u);
  ASSERT_EQ(t[0].words.size(), 2u);
  EXPECT_DOUBLE_EQ(t[0].words[0].confidence, 1.0);
  EXPECT_DOUBLE_EQ(t[0].words[1].confidence, 0.25);
  EXPECT_FALSE(t[1].has_words());
}

TEST(ParseJson, RejectsNonArrayAndBadSyntax) {
  EXPECT_THROW(parse_json(R"({"content": "x"})"), std::invalid_argument);
  EXPECT_THROW(parse_json("[{"), nlohmann::json::exception);
}

TEST(CanonicalJson, WritesSchemaReadBackByParser) {
  Transcript t(1);
  t[0].content = "hi there";
  t[0].start = 0.5;
  t[0].end = 1.5;
  t[0].words = {Word{"hi", 0.5, 1.0, 0.9, ""}, Word{"there", 1.0, 1.5, 1.0, ""}};

  auto doc = nlohmann::json::parse(to_canonical_json(t));
  ASSERT_TRUE(doc.is_array());
  EXPECT_EQ(doc[0]["content"].get<std::string>(), "hi there");
  EXPECT_DOUBLE_EQ(doc[0]["words"][0]["conf"].get<double>(), 0.9);
  EXPECT_FALSE(doc[0]["words"][0].contains("file"));

  auto back = parse_json(doc.dump());
  ASSERT_EQ(back.size(), 1u);
  EXPECT_EQ(back[0].words.size(), 2u);
}

// **---- Sphinx ----**

TEST(ParseSphinx, SentencesSkipFillersAndAlternates) {
  const std::string text = "<s> 0.00 0.10 1.0\n"
                           "hello(2) 0.10 0.50 0.9\n"
                           "<sil> 0.50 0.60 1.0\n"
                           "[NOISE] 0.60 0.70 1.0\n"
                           "++UH++ 0.70 0.72 1.0\n"
                           "world 0.72 1.20 0.8\n"
                           "</s> 1.20 1.30 1.0\n"
                           "bad line\n"
                           "<s> 2.00 2.10 1.0\n"
                           "again 2.10 2.60 0.7\n"
                           "</s> 2.60 2.70 1.0\n";
  auto t = parse_sphinx(text);
  ASSERT_EQ(t.size(), 2u);
  EXPECT_EQ(t[0].content, "hello world");
  EXPECT_DOUBLE_EQ(t[0].start, 0.10);
  EXPECT_DOUBLE_EQ(t[0].end, 1.20);
  ASSERT_EQ(t[0].words.size(), 2u);
  EXPECT_EQ(t[0].words[0].word, "hello");
  EXPECT_DOUBLE_EQ(t[0].words[1].confidence, 0.8);
  EXPECT_EQ(t[1].content, "again");
}

// **---- WebVTT output ----**

TEST(RenderVtt, CuesFollowTheOutputTimeline) {
  Composition c(2);
  c[0].start = 10.0;
  c[0].end = 12.0;
  c[0].content = "first";
  c[1].start = 5.0;
  c[1].end = 6.5;
  c[1].content = "second";

  const std::string expected = "WEBVTT\n"
                               "\n1\n00:00:00.000 --> 00:00:02.000\nfirst\n"
                               "\n2\n00:00:02.000 --> 00:00:03.500\nsecond\n";
  EXPECT_EQ(render_vtt(c), expected);
}
