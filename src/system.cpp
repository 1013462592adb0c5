/**
 * @file system.cpp
 * @brief File, path, text and time utilities implementation
 */

#include "voxcut/system.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>

namespace voxcut {

namespace fs = std::filesystem;

// **---- Time Formatting ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string format_vtt_timestamp(double seconds) {
  if (seconds < 0)
    seconds = 0;
  long total_ms = std::lround(seconds * 1000.0);
  long h = total_ms / 3600000;
  long m = (total_ms % 3600000) / 60000;
  long s = (total_ms % 60000) / 1000;
  long ms = total_ms % 1000;
  return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}", h, m, s, ms);
}

// **---- Paths ----**

std::string lower_extension(const std::string &path) {
  return to_lower(fs::path(path).extension().string());
}

std::string replace_extension(const std::string &path,
                              const std::string &suffix) {
  fs::path p(path);
  return (p.parent_path() / p.stem()).string() + suffix;
}

std::string read_text_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw std::runtime_error("cannot open " + path);

  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  if (in.bad())
    throw std::runtime_error("read error on " + path);

  /// Strip UTF-8 BOM
  if (content.size() >= 3 && static_cast<unsigned char>(content[0]) == 0xEF &&
      static_cast<unsigned char>(content[1]) == 0xBB &&
      static_cast<unsigned char>(content[2]) == 0xBF) {
    content.erase(0, 3);
  }
  return content;
}

ScopedFile::~ScopedFile() {
  if (path_.empty())
    return;
  std::error_code ec;
  fs::remove(path_, ec);
}

// **---- Text ----**

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

std::string trim(const std::string &text) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto first = std::find_if_not(text.begin(), text.end(), is_space);
  auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
  return (first < last) ? std::string(first, last) : std::string();
}

std::vector<std::string> split_whitespace(const std::string &text) {
  std::vector<std::string> tokens;
  std::istringstream in(text);
  std::string token;
  while (in >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

std::string regex_escape(const std::string &text) {
  static const std::string special = R"(\^$.|?*+()[]{})";
  std::string out;
  out.reserve(text.size() * 2);
  for (char c : text) {
    if (special.find(c) != std::string::npos)
      out += '\\';
    out += c;
  }
  return out;
}

} // namespace voxcut
