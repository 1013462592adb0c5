/**
 * @file types.cpp
 * @brief Enum name conversions
 */

#include "voxcut/types.hpp"

#include "voxcut/errors.hpp"
#include "voxcut/system.hpp"

namespace voxcut {

SearchType parse_search_type(const std::string &name) {
  std::string key = to_lower(trim(name));
  if (key == "sentence")
    return SearchType::Sentence;
  if (key == "fragment")
    return SearchType::Fragment;
  if (key == "mash")
    return SearchType::Mash;
  if (key == "semantic")
    return SearchType::Semantic;
  throw InvalidSearchTypeError("unknown search type: '" + name +
                               "' (expected sentence, fragment, mash or "
                               "semantic)");
}

const char *to_string(SearchType type) {
  switch (type) {
  case SearchType::Sentence:
    return "sentence";
  case SearchType::Fragment:
    return "fragment";
  case SearchType::Mash:
    return "mash";
  case SearchType::Semantic:
    return "semantic";
  }
  return "unknown";
}

const char *to_string(TranscriptFormat format) {
  switch (format) {
  case TranscriptFormat::Json:
    return "json";
  case TranscriptFormat::Vtt:
    return "vtt";
  case TranscriptFormat::Srt:
    return "srt";
  case TranscriptFormat::Sphinx:
    return "transcript";
  case TranscriptFormat::Unknown:
    break;
  }
  return "unknown";
}

const char *to_string(MediaType type) {
  switch (type) {
  case MediaType::Video:
    return "video";
  case MediaType::Audio:
    return "audio";
  case MediaType::Unknown:
    break;
  }
  return "unknown";
}

const char *to_string(ExportStrategy strategy) {
  switch (strategy) {
  case ExportStrategy::Video:
    return "video";
  case ExportStrategy::Audio:
    return "audio";
  }
  return "unknown";
}

} // namespace voxcut
