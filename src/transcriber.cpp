/**
 * @file transcriber.cpp
 * @brief Transcription persistence implementation
 */

#include "voxcut/transcriber.hpp"

#include <fstream>
#include <stdexcept>

#include "voxcut/errors.hpp"
#include "voxcut/logging.hpp"
#include "voxcut/system.hpp"
#include "voxcut/transcript_formats.hpp"

namespace voxcut {

std::string Transcriber::persist(const std::string &media_path,
                                 const Transcript &segments) {
  std::string path = replace_extension(media_path, ".json");

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out)
    throw std::runtime_error("cannot open " + path + " for writing");
  out << to_canonical_json(segments);
  out.close();
  if (!out)
    throw std::runtime_error("write error on " + path);

  if (store_)
    store_->invalidate(path);

  LOG_INFO("Transcript written to {} ({} segments)", path, segments.size());
  return path;
}

TranscriptionOutcome Transcriber::transcribe(const std::string &media_path) {
  TranscriptionOutcome outcome;

  LOG_PHASE("Transcribing {}", media_path);
  TIMER_START(transcribe);

  std::string failure;
  try {
    provider_.transcribe(media_path, [&outcome, &media_path](const Segment &s) {
      Segment seg = s;
      seg.file = media_path;
      outcome.segments.push_back(std::move(seg));
    });
  } catch (const TranscriptionInterrupted &) {
    outcome.interrupted = true;
    LOG_WARN("Transcription of {} interrupted after {} segments", media_path,
             outcome.segments.size());
  } catch (const std::exception &e) {
    failure = e.what();
    LOG_ERROR("Transcription of {} failed after {} segments: {}", media_path,
              outcome.segments.size(), failure);
  }

  TIMER_END(transcribe);

  if (!outcome.segments.empty()) {
    try {
      outcome.transcript_path = persist(media_path, outcome.segments);
    } catch (const std::exception &e) {
      throw TranscriptionFailedError(fmt::format(
          "could not save transcript for {}: {}", media_path, e.what()));
    }
  } else if (outcome.interrupted || !failure.empty()) {
    LOG_WARN("No segments to save for {}", media_path);
  }

  if (!failure.empty()) {
    throw TranscriptionFailedError(
        fmt::format("transcription of {} failed: {}", media_path, failure));
  }
  return outcome;
}

} // namespace voxcut
