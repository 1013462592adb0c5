/**
 * @file transcript_formats.hpp
 * @brief Parsers and writers for the supported transcript formats
 *
 * @details Four input formats are understood, all producing the canonical
 *          Transcript (vector of Segment):
 *
 *          - WebVTT (.vtt): cue based, with optional inline per-word
 *            `<HH:MM:SS.mmm>` tags giving word timing
 *
 *          - SubRip (.srt): numbered plain timed blocks, no word timing
 *
 *          - Canonical JSON (.json): `[{content, start, end, words?}]`, also
 *            the format written by the transcriber
 *
 *          - Legacy phoneme-aligned (.transcript): one `token start end conf`
 *            per line with `<s>` / `</s>` sentence markers
 *
 * @note Parsers throw on malformed input (std::invalid_argument for bad
 *       timestamps or shapes, nlohmann::json::exception for bad JSON).
 *       TranscriptStore turns those into logged parse failures.
 */

#ifndef VOXCUT_TRANSCRIPT_FORMATS_HPP
#define VOXCUT_TRANSCRIPT_FORMATS_HPP

#include <string>

#include "types.hpp"

namespace voxcut {

/**
 * @brief Convert "HH:MM:SS.mmm", "HH:MM:SS,mmm" or "MM:SS.mmm" to seconds.
 * @throws std::invalid_argument on malformed input
 */
double parse_timestamp(const std::string &ts);

/// Map a transcript path to its format by (lowercased) extension.
TranscriptFormat format_for_path(const std::string &path);

Transcript parse_vtt(const std::string &text);
Transcript parse_srt(const std::string &text);
Transcript parse_json(const std::string &text);
Transcript parse_sphinx(const std::string &text);

/**
 * @brief Dispatch to the parser for `format`.
 * @throws std::invalid_argument for TranscriptFormat::Unknown
 */
Transcript parse_as(TranscriptFormat format, const std::string &text);

/**
 * @brief Serialize a transcript to the canonical JSON schema.
 * @note Words are written as `{word, start, end, conf}`; `file` is omitted.
 */
std::string to_canonical_json(const Transcript &transcript);

/**
 * @brief Render a composition as WebVTT on the output timeline.
 * @note Each cue starts where the previous one ended, so cue timing follows
 *       the rendered supercut rather than the source media.
 */
std::string render_vtt(const Composition &composition);

} // namespace voxcut

#endif // VOXCUT_TRANSCRIPT_FORMATS_HPP
