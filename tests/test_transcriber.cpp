#include <stdexcept>

#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "voxcut/errors.hpp"
#include "voxcut/transcriber.hpp"
#include "voxcut/transcript_formats.hpp"

using namespace voxcut;
using voxcut::testing::TempDir;

namespace {

enum class Ending { Complete, Interrupted, Crashed };

/// Emits `count` one-second segments, then ends as configured.
class ScriptedProvider : public TranscriptionProvider {
public:
  ScriptedProvider(size_t count, Ending ending) : count_(count), ending_(ending) {}

  void transcribe(const std::string &,
                  const SegmentCallback &on_segment) override {
    for (size_t i = 0; i < count_; ++i) {
      Segment s;
      s.start = static_cast<double>(i);
      s.end = static_cast<double>(i + 1);
      s.content = "segment " + std::to_string(i);
      on_segment(s);
    }
    if (ending_ == Ending::Interrupted)
      throw TranscriptionInterrupted();
    if (ending_ == Ending::Crashed)
      throw std::runtime_error("decoder exploded");
  }

private:
  size_t count_;
  Ending ending_;
};

} // namespace

class TranscriberTest : public ::testing::Test {
protected:
  TempDir dir;
  TranscriptCache cache;
  TranscriptStore store{cache};
  std::string media;

  void SetUp() override { media = dir.write("talk.mp4", ""); }
};

TEST_F(TranscriberTest, CompleteRunWritesCanonicalJson) {
  ScriptedProvider provider(3, Ending::Complete);
  Transcriber transcriber(provider, &store);

  auto outcome = transcriber.transcribe(media);
  EXPECT_FALSE(outcome.interrupted);
  EXPECT_EQ(outcome.transcript_path, dir.file("talk.json"));
  ASSERT_EQ(outcome.segments.size(), 3u);
  EXPECT_EQ(outcome.segments[0].file, media);

  auto parsed = parse_json(voxcut::testing::slurp(outcome.transcript_path));
  ASSERT_EQ(parsed.size(), 3u);
  EXPECT_EQ(parsed[2].content, "segment 2");
}

TEST_F(TranscriberTest, InterruptionKeepsTheReceivedPrefix) {
  ScriptedProvider provider(2, Ending::Interrupted);
  Transcriber transcriber(provider);

  TranscriptionOutcome outcome;
  EXPECT_NO_THROW(outcome = transcriber.transcribe(media));
  EXPECT_TRUE(outcome.interrupted);
  EXPECT_EQ(outcome.segments.size(), 2u);

  auto parsed = parse_json(voxcut::testing::slurp(dir.file("talk.json")));
  EXPECT_EQ(parsed.size(), 2u);
}

TEST_F(TranscriberTest, InterruptionBeforeAnySegmentWritesNothing) {
  ScriptedProvider provider(0, Ending::Interrupted);
  Transcriber transcriber(provider);

  auto outcome = transcriber.transcribe(media);
  EXPECT_TRUE(outcome.interrupted);
  EXPECT_TRUE(outcome.transcript_path.empty());
  EXPECT_FALSE(voxcut::testing::exists(dir.file("talk.json")));
}

TEST_F(TranscriberTest, ProviderFailureThrowsAfterSavingPrefix) {
  ScriptedProvider provider(1, Ending::Crashed);
  Transcriber transcriber(provider);

  EXPECT_THROW(transcriber.transcribe(media), TranscriptionFailedError);
  auto parsed = parse_json(voxcut::testing::slurp(dir.file("talk.json")));
  ASSERT_EQ(parsed.size(), 1u);
  EXPECT_EQ(parsed[0].content, "segment 0");
}

TEST_F(TranscriberTest, RewriteDropsTheCachedParse) {
  dir.write("talk.json", R"([{"content": "stale", "start": 0, "end": 1}])");
  auto before = store.parse_transcript(media);
  ASSERT_NE(before, nullptr);
  EXPECT_EQ((*before)[0].content, "stale");

  ScriptedProvider provider(2, Ending::Complete);
  Transcriber transcriber(provider, &store);
  transcriber.transcribe(media);

  auto after = store.parse_transcript(media);
  ASSERT_NE(after, nullptr);
  ASSERT_EQ(after->size(), 2u);
  EXPECT_EQ((*after)[0].content, "segment 0");
}
