/**
 * @file errors.hpp
 * @brief Exception hierarchy for errors that reach the caller
 *
 * @details Per-file and per-batch problems are NOT thrown. They are recorded
 *          as ItemError entries (see types.hpp) and logged. Only the errors
 *          below propagate out of the engine:
 *
 *          - InvalidSearchTypeError: unknown strategy name
 *
 *          - CapabilityUnavailableError: semantic search without an
 *            embedding provider
 *
 *          - InvalidOutputFormatError: audio-only input to a video output
 *
 *          - ExportFailedError: zero batches (or clips) rendered
 *
 *          - TranscriptionFailedError: provider failure during transcription
 */

#ifndef VOXCUT_ERRORS_HPP
#define VOXCUT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace voxcut {

/// Base class for every voxcut exception.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string &what) : std::runtime_error(what) {}
};

class InvalidSearchTypeError : public Error {
public:
  using Error::Error;
};

class CapabilityUnavailableError : public Error {
public:
  using Error::Error;
};

class InvalidOutputFormatError : public Error {
public:
  using Error::Error;
};

class ExportFailedError : public Error {
public:
  using Error::Error;
};

class TranscriptionFailedError : public Error {
public:
  using Error::Error;
};

/**
 * @class TranscriptionInterrupted
 * @brief Thrown by a TranscriptionProvider when the run is cancelled.
 * @note The transcriber persists the completed prefix and returns normally.
 */
class TranscriptionInterrupted : public Error {
public:
  TranscriptionInterrupted() : Error("transcription interrupted") {}
  using Error::Error;
};

} // namespace voxcut

#endif // VOXCUT_ERRORS_HPP
