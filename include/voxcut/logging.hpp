/**
 * @file logging.hpp
 * @brief Console logging and phase timing for voxcut runs
 *
 * @details Every stage of a run reports through these macros: transcript
 *          lookup and parse failures (LOG_WARN), search and composition
 *          progress (LOG_INFO), export batches and their ffmpeg failures
 *          (LOG_ERROR), and the run banners (LOG_PHASE, LOG_SUCCESS).
 *
 *          TIMER_START / TIMER_END wrap the search, transcription and export
 *          phases. The CLI prints the collected timings, grouped per phase,
 *          when it exits.
 *
 * @note Build with ENABLE_LOGGING=0 or ENABLE_TIMING=0 to compile the
 *       macros out. Output is flushed per line so batch progress shows up
 *       while ffmpeg is still rendering.
 */

#ifndef VOXCUT_LOGGING_HPP
#define VOXCUT_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace voxcut {

// **----- LOGGING CONFIGURATION -----**

#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Keeps log lines whole when several threads log at once
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(voxcut::log_mutex);                       \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(voxcut::log_mutex);                       \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(voxcut::log_mutex);                       \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(voxcut::log_mutex);                       \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(voxcut::log_mutex);                       \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/// One TIMER_END measurement.
struct TimingEntry {
  std::string name;  //< Phase name given to TIMER_START
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Process-wide store of phase timings.
 * @note A phase may run many times per process (one "search" per query
 *       set in a long-lived engine); entries are kept in recording order.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  static void record(const std::string &name, long us);

  /**
   * @brief Print one row per phase: call count, total and mean time.
   * @note Phases appear in the order they were first recorded.
   */
  static void print_summary();

  /// Copy of the raw entries in recording order.
  static std::vector<TimingEntry> snapshot();

  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::high_resolution_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::high_resolution_clock::now();         \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    voxcut::TimingCollector::record(#name, timer_duration_##name);             \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace voxcut

#endif // VOXCUT_LOGGING_HPP
