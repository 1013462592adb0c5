/**
 * @file transcript_formats.cpp
 * @brief Transcript parsers and writers implementation
 */

#include "voxcut/transcript_formats.hpp"

#include <regex>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "voxcut/system.hpp"

namespace voxcut {

namespace {

using json = nlohmann::json;

/// Split into lines, dropping a trailing '\r' from each.
std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    lines.push_back(line);
  }
  return lines;
}

std::string join_words(const std::vector<Word> &words) {
  std::string out;
  for (const auto &w : words) {
    if (!out.empty())
      out += ' ';
    out += w.word;
  }
  return out;
}

/// Parse "start --> end [settings]" into seconds.
bool parse_cue_timing(const std::string &line, double &start, double &end) {
  size_t arrow = line.find("-->");
  if (arrow == std::string::npos)
    return false;
  start = parse_timestamp(trim(line.substr(0, arrow)));
  auto rest = split_whitespace(line.substr(arrow + 3));
  if (rest.empty())
    throw std::invalid_argument("cue without end time: " + line);
  end = parse_timestamp(rest.front());
  return true;
}

/**
 * @brief Spread the words of one text run evenly over [run_start, run_end].
 * @note A run holding a single word gets exactly the span between its two
 *       surrounding inline timestamps.
 */
void append_run(const std::string &run, double run_start, double run_end,
                std::vector<Word> &words) {
  auto tokens = split_whitespace(run);
  if (tokens.empty())
    return;
  if (run_end < run_start)
    run_end = run_start;
  double step = (run_end - run_start) / static_cast<double>(tokens.size());
  for (size_t j = 0; j < tokens.size(); ++j) {
    Word w;
    w.word = tokens[j];
    w.start = run_start + static_cast<double>(j) * step;
    w.end = run_start + static_cast<double>(j + 1) * step;
    words.push_back(std::move(w));
  }
}

// **---- WebVTT ----**

const std::regex &inline_tag_regex() {
  static const std::regex re(R"(<(\d\d:\d\d:\d\d(?:\.\d+)?)>)");
  return re;
}

Transcript parse_vtt_cued(
    const std::vector<std::pair<std::string, std::string>> &cues) {
  static const std::regex styling(R"(<(?!/?\d\d:\d\d:\d\d)/?[^>]+>)");

  Transcript out;
  for (const auto &[meta, content] : cues) {
    double seg_start = 0.0;
    double seg_end = 0.0;
    if (!parse_cue_timing(meta, seg_start, seg_end))
      continue;

    std::string clean = std::regex_replace(content, styling, "");

    Segment seg;
    seg.start = seg_start;
    seg.end = seg_end;

    double current = seg_start;
    size_t pos = 0;
    for (std::sregex_iterator it(clean.begin(), clean.end(),
                                 inline_tag_regex()),
         end_it;
         it != end_it; ++it) {
      const std::smatch &m = *it;
      double tag_time = parse_timestamp(m[1].str());
      append_run(clean.substr(pos, static_cast<size_t>(m.position(0)) - pos),
                 current, tag_time, seg.words);
      current = tag_time;
      pos = static_cast<size_t>(m.position(0) + m.length(0));
    }
    append_run(clean.substr(pos), current, seg_end, seg.words);

    if (!seg.words.empty()) {
      seg.content = join_words(seg.words);
      out.push_back(std::move(seg));
    }
  }
  return out;
}

/**
 * @brief Plain WebVTT cues, one segment per blank-line separated block.
 * @note A block's optional identifier is its first line, directly above the
 *       timing line. Blocks without a timing line (header, NOTE, STYLE) are
 *       skipped.
 */
Transcript parse_vtt_uncued(const std::vector<std::string> &raw_lines) {
  std::vector<std::vector<std::string>> blocks(1);
  for (const auto &l : raw_lines) {
    auto t = trim(l);
    if (t.empty()) {
      if (!blocks.back().empty())
        blocks.emplace_back();
      continue;
    }
    blocks.back().push_back(std::move(t));
  }

  Transcript out;
  for (const auto &block : blocks) {
    size_t timing = 0;
    if (block.size() > 1 && block[0].find("-->") == std::string::npos &&
        block[1].find("-->") != std::string::npos)
      timing = 1;
    if (timing >= block.size() ||
        block[timing].find("-->") == std::string::npos)
      continue;

    Segment seg;
    parse_cue_timing(block[timing], seg.start, seg.end);
    for (size_t i = timing + 1; i < block.size(); ++i) {
      if (!seg.content.empty())
        seg.content += ' ';
      seg.content += block[i];
    }
    out.push_back(std::move(seg));
  }
  return out;
}

} // namespace

// **---- Timestamps ----**

double parse_timestamp(const std::string &ts) {
  static const std::regex re(
      R"(^\s*(?:(\d+):)?(\d{1,2}):(\d{1,2}(?:[.,]\d+)?)\s*$)");
  std::smatch m;
  if (!std::regex_match(ts, m, re))
    throw std::invalid_argument("malformed timestamp: '" + ts + "'");

  double hours = m[1].matched ? std::stod(m[1].str()) : 0.0;
  double minutes = std::stod(m[2].str());
  std::string sec = m[3].str();
  for (auto &c : sec) {
    if (c == ',')
      c = '.';
  }
  return hours * 3600.0 + minutes * 60.0 + std::stod(sec);
}

TranscriptFormat format_for_path(const std::string &path) {
  auto ext = lower_extension(path);
  if (ext == ".json")
    return TranscriptFormat::Json;
  if (ext == ".vtt")
    return TranscriptFormat::Vtt;
  if (ext == ".srt")
    return TranscriptFormat::Srt;
  if (ext == ".transcript")
    return TranscriptFormat::Sphinx;
  return TranscriptFormat::Unknown;
}

// **---- Parsers ----**

Transcript parse_vtt(const std::string &text) {
  static const std::regex has_timestamp(R"(\d\d:\d\d:\d\d)");

  auto lines = split_lines(text);

  std::vector<std::string> timed;
  for (const auto &l : lines) {
    if (std::regex_search(l, has_timestamp))
      timed.push_back(l);
  }

  /// Pair every line carrying inline word tags with the cue header above it
  std::vector<std::pair<std::string, std::string>> cues;
  for (size_t i = 1; i < timed.size(); ++i) {
    if (std::regex_search(timed[i], inline_tag_regex()))
      cues.emplace_back(timed[i - 1], timed[i]);
  }

  if (!cues.empty())
    return parse_vtt_cued(cues);
  return parse_vtt_uncued(lines);
}

Transcript parse_srt(const std::string &text) {
  Transcript out;
  std::vector<std::string> block;

  auto flush = [&out, &block]() {
    size_t timing = block.size();
    for (size_t i = 0; i < block.size(); ++i) {
      if (block[i].find("-->") != std::string::npos) {
        timing = i;
        break;
      }
    }
    if (timing < block.size()) {
      Segment seg;
      parse_cue_timing(block[timing], seg.start, seg.end);
      for (size_t i = timing + 1; i < block.size(); ++i) {
        if (!seg.content.empty())
          seg.content += ' ';
        seg.content += block[i];
      }
      out.push_back(std::move(seg));
    }
    block.clear();
  };

  for (const auto &line : split_lines(text)) {
    auto t = trim(line);
    if (t.empty()) {
      flush();
    } else {
      block.push_back(std::move(t));
    }
  }
  flush();
  return out;
}

Transcript parse_json(const std::string &text) {
  json doc = json::parse(text);
  if (!doc.is_array())
    throw std::invalid_argument("transcript JSON must be a top-level array");

  Transcript out;
  out.reserve(doc.size());
  for (const auto &item : doc) {
    Segment seg;
    seg.content = item.value("content", std::string());
    seg.start = item.at("start").get<double>();
    seg.end = item.at("end").get<double>();

    auto words = item.find("words");
    if (words != item.end() && words->is_array()) {
      for (const auto &w : *words) {
        Word word;
        word.word = w.at("word").get<std::string>();
        word.start = w.at("start").get<double>();
        word.end = w.at("end").get<double>();
        word.confidence = w.value("conf", 1.0);
        seg.words.push_back(std::move(word));
      }
    }
    out.push_back(std::move(seg));
  }
  return out;
}

Transcript parse_sphinx(const std::string &text) {
  static const std::regex alt_pronunciation(R"(\(\d+\)$)");

  Transcript out;
  Segment current;
  bool open = false;

  auto close = [&]() {
    if (open && !current.words.empty()) {
      current.start = current.words.front().start;
      current.end = current.words.back().end;
      current.content = join_words(current.words);
      out.push_back(std::move(current));
    }
    current = Segment();
    open = false;
  };

  for (const auto &line : split_lines(text)) {
    auto fields = split_whitespace(line);
    if (fields.size() != 4)
      continue;

    const std::string &token = fields[0];
    double start = std::stod(fields[1]);
    double end = std::stod(fields[2]);
    double conf = std::stod(fields[3]);

    if (token == "<s>") {
      close();
      open = true;
      continue;
    }
    if (token == "</s>") {
      close();
      continue;
    }
    /// Silence, noise and filler markers carry no speech
    if (token == "<sil>" || token.front() == '[' || token.front() == '<' ||
        token.rfind("++", 0) == 0)
      continue;

    open = true;
    Word w;
    w.word = std::regex_replace(token, alt_pronunciation, "");
    w.start = start;
    w.end = end;
    w.confidence = conf;
    current.words.push_back(std::move(w));
  }
  close();
  return out;
}

Transcript parse_as(TranscriptFormat format, const std::string &text) {
  switch (format) {
  case TranscriptFormat::Json:
    return parse_json(text);
  case TranscriptFormat::Vtt:
    return parse_vtt(text);
  case TranscriptFormat::Srt:
    return parse_srt(text);
  case TranscriptFormat::Sphinx:
    return parse_sphinx(text);
  case TranscriptFormat::Unknown:
    break;
  }
  throw std::invalid_argument("unknown transcript format");
}

// **---- Writers ----**

std::string to_canonical_json(const Transcript &transcript) {
  json doc = json::array();
  for (const auto &seg : transcript) {
    json item = {
        {"content", seg.content}, {"start", seg.start}, {"end", seg.end}};
    if (seg.has_words()) {
      json words = json::array();
      for (const auto &w : seg.words) {
        words.push_back({{"word", w.word},
                         {"start", w.start},
                         {"end", w.end},
                         {"conf", w.confidence}});
      }
      item["words"] = std::move(words);
    }
    doc.push_back(std::move(item));
  }
  return doc.dump(2);
}

std::string render_vtt(const Composition &composition) {
  std::string out = "WEBVTT\n";
  double start = 0.0;
  for (size_t i = 0; i < composition.size(); ++i) {
    const auto &c = composition[i];
    double end = start + c.duration();
    out += fmt::format("\n{}\n{} --> {}\n{}\n", i + 1,
                       format_vtt_timestamp(start), format_vtt_timestamp(end),
                       c.content);
    start = end;
  }
  return out;
}

} // namespace voxcut
