/**
 * @file transcriber.hpp
 * @brief Producing canonical JSON transcripts from a speech-to-text provider
 *
 * @details The Transcriber streams segments from a TranscriptionProvider and
 *          writes them to `<media stem>.json` beside the media file. When
 *          the provider stops early the segments received so far are still
 *          written:
 *
 *          - TranscriptionInterrupted: prefix written, outcome returned with
 *            `interrupted` set
 *
 *          - any other exception: prefix written, TranscriptionFailedError
 *            thrown
 */

#ifndef VOXCUT_TRANSCRIBER_HPP
#define VOXCUT_TRANSCRIBER_HPP

#include <functional>
#include <string>

#include "transcript_store.hpp"
#include "types.hpp"

namespace voxcut {

/**
 * @class TranscriptionProvider
 * @brief Speech-to-text backend.
 */
class TranscriptionProvider {
public:
  using SegmentCallback = std::function<void(const Segment &)>;

  virtual ~TranscriptionProvider() = default;

  /**
   * @brief Transcribe a media file, reporting each finished segment.
   * @throws TranscriptionInterrupted when cancelled; anything else on failure
   */
  virtual void transcribe(const std::string &media_path,
                          const SegmentCallback &on_segment) = 0;
};

/**
 * @struct TranscriptionOutcome
 * @brief What a transcription run produced.
 */
struct TranscriptionOutcome {
  std::string transcript_path; //< Written JSON (empty if nothing was written)
  Transcript segments;         //< Segments received, in order
  bool interrupted = false;    //< Provider stopped early
};

/**
 * @class Transcriber
 * @brief Drives a provider and persists its output.
 */
class Transcriber {
public:
  /**
   * @param provider Speech-to-text backend
   * @param store Store whose cache entry is dropped after each write
   *              (optional)
   */
  explicit Transcriber(TranscriptionProvider &provider,
                       TranscriptStore *store = nullptr)
      : provider_(provider), store_(store) {}

  /// @throws TranscriptionFailedError on provider failure (prefix kept)
  TranscriptionOutcome transcribe(const std::string &media_path);

private:
  TranscriptionProvider &provider_;
  TranscriptStore *store_;

  /// Write segments as canonical JSON and drop any cached parse.
  std::string persist(const std::string &media_path,
                      const Transcript &segments);
};

} // namespace voxcut

#endif // VOXCUT_TRANSCRIBER_HPP
