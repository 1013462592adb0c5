/**
 * @file transcript_store.cpp
 * @brief Transcript discovery, parsing and caching implementation
 */

#include "voxcut/transcript_store.hpp"

#include <algorithm>
#include <mutex>
#include <regex>
#include <vector>

#include "voxcut/logging.hpp"
#include "voxcut/system.hpp"
#include "voxcut/transcript_formats.hpp"

namespace voxcut {

namespace fs = std::filesystem;

// **---- TranscriptCache ----**

std::shared_ptr<const Transcript>
TranscriptCache::get(const std::string &path, clock_time mtime) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = entries_.find(path);
  if (it == entries_.end() || it->second.mtime != mtime) {
    ++misses_;
    return nullptr;
  }
  ++hits_;
  return it->second.transcript;
}

void TranscriptCache::put(const std::string &path, clock_time mtime,
                          std::shared_ptr<const Transcript> transcript) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_[path] = Entry{std::move(transcript), mtime};
}

void TranscriptCache::invalidate(const std::string &path) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.erase(path);
}

void TranscriptCache::clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.clear();
}

size_t TranscriptCache::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

// **---- Resolution ----**

namespace {

/// Candidate extensions, preferred one first, without duplicates.
std::vector<std::string>
candidate_extensions(const std::optional<std::string> &preferred_ext) {
  std::vector<std::string> exts;
  if (preferred_ext && !preferred_ext->empty()) {
    std::string pref = to_lower(*preferred_ext);
    if (pref.front() != '.')
      pref.insert(pref.begin(), '.');
    exts.push_back(pref);
  }
  for (const auto &ext : transcript_extensions()) {
    if (std::find(exts.begin(), exts.end(), ext) == exts.end())
      exts.push_back(ext);
  }
  return exts;
}

/// Regular files in a directory, sorted by name.
std::vector<fs::path> sibling_files(const fs::path &dir) {
  std::vector<fs::path> files;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec))
      files.push_back(it->path());
  }
  std::sort(files.begin(), files.end());
  return files;
}

} // namespace

std::optional<std::string> TranscriptStore::find_transcript(
    const std::string &media_path,
    const std::optional<std::string> &preferred_ext) const {
  fs::path media(media_path);
  fs::path dir = media.parent_path();
  if (dir.empty())
    dir = ".";

  std::error_code ec;
  if (!fs::is_directory(dir, ec))
    return std::nullopt;

  const std::string stem = media.stem().string();
  const auto exts = candidate_extensions(preferred_ext);

  /// 1. Exact sibling: <stem><ext>
  for (const auto &ext : exts) {
    fs::path candidate = media.parent_path() / (stem + ext);
    if (fs::is_regular_file(candidate, ec))
      return candidate.string();
  }

  const auto siblings = sibling_files(dir);

  /// 2. Fuzzy: <stem>*<ext>, e.g. video.en.srt
  for (const auto &ext : exts) {
    for (const auto &file : siblings) {
      const std::string name = file.filename().string();
      if (name.rfind(stem, 0) == 0 && lower_extension(name) == ext)
        return file.string();
    }
  }

  /// 3. Last resort: stem, anything, then the bare extension name
  for (const auto &ext : exts) {
    std::regex pattern(regex_escape(stem) + R"(.*?\.?)" +
                           regex_escape(ext.substr(1)),
                       std::regex::ECMAScript | std::regex::icase);
    for (const auto &file : siblings) {
      if (file == media)
        continue;
      if (std::regex_search(file.filename().string(), pattern))
        return file.string();
    }
  }

  return std::nullopt;
}

// **---- Parsing ----**

LoadResult
TranscriptStore::load_transcript(const std::string &media_path,
                                 const std::optional<std::string> &preferred_ext) {
  LoadResult result;

  auto path = find_transcript(media_path, preferred_ext);
  if (!path) {
    result.error = ItemError{media_path, "no transcript found"};
    return result;
  }

  std::error_code ec;
  auto mtime = fs::last_write_time(*path, ec);
  if (ec) {
    result.error =
        ItemError{media_path, fmt::format("cannot stat {}: {}", *path,
                                          ec.message())};
    return result;
  }

  if (auto cached = cache_.get(*path, mtime)) {
    result.transcript = std::move(cached);
    return result;
  }

  TranscriptFormat format = format_for_path(*path);
  if (format == TranscriptFormat::Unknown) {
    result.error = ItemError{
        media_path, fmt::format("unsupported transcript format: {}", *path)};
    return result;
  }

  try {
    Transcript segments = parse_as(format, read_text_file(*path));
    for (auto &seg : segments) {
      seg.file = media_path;
    }
    auto shared = std::make_shared<const Transcript>(std::move(segments));
    cache_.put(*path, mtime, shared);
    result.transcript = std::move(shared);
  } catch (const std::exception &e) {
    result.error = ItemError{
        media_path, fmt::format("failed to parse {} as {}: {}", *path,
                                to_string(format), e.what())};
  }
  return result;
}

std::shared_ptr<const Transcript> TranscriptStore::parse_transcript(
    const std::string &media_path,
    const std::optional<std::string> &preferred_ext) {
  auto result = load_transcript(media_path, preferred_ext);
  if (!result.ok()) {
    LOG_ERROR("{}: {}", result.error->item, result.error->message);
    return nullptr;
  }
  return result.transcript;
}

} // namespace voxcut
