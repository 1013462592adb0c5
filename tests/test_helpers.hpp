/**
 * @file test_helpers.hpp
 * @brief Scratch directories and fakes shared by the test suite
 */

#ifndef VOXCUT_TEST_HELPERS_HPP
#define VOXCUT_TEST_HELPERS_HPP

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include <unistd.h>

#include <fmt/core.h>

namespace voxcut {
namespace testing {

/**
 * @class TempDir
 * @brief Fresh directory under the system temp dir, removed on destruction.
 */
class TempDir {
public:
  TempDir() {
    static std::atomic<int> counter{0};
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            fmt::format("voxcut_test_{}_{}_{}", getpid(), counter++, rd());
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &path() const { return path_; }

  /// Absolute path of `name` inside the directory.
  std::string file(const std::string &name) const {
    return (path_ / name).string();
  }

  /// Write `content` to `name` and return its path.
  std::string write(const std::string &name, const std::string &content) const {
    std::string p = file(name);
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
    return p;
  }

private:
  std::filesystem::path path_;
};

inline bool exists(const std::string &path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

/// Create or truncate a file holding a placeholder byte.
inline void touch(const std::string &path) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << 'x';
}

inline std::string slurp(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

} // namespace testing
} // namespace voxcut

#endif // VOXCUT_TEST_HELPERS_HPP
