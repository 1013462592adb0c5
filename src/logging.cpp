/**
 * @file logging.cpp
 * @brief Log mutex and phase timing table
 */

#include "voxcut/logging.hpp"

#include <algorithm>
#include <cstddef>

#include <fmt/color.h>
#include <fmt/core.h>

namespace voxcut {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  struct PhaseTotal {
    std::string name;
    size_t calls = 0;
    long microseconds = 0;
  };

  /// Group by phase, first-seen order
  std::vector<PhaseTotal> phases;
  for (const auto &e : entries) {
    auto it = std::find_if(phases.begin(), phases.end(),
                           [&e](const PhaseTotal &p) { return p.name == e.name; });
    if (it == phases.end()) {
      phases.push_back({e.name, 0, 0});
      it = phases.end() - 1;
    }
    ++it->calls;
    it->microseconds += e.microseconds;
  }

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "===================== PHASE TIMINGS =====================\n");
  fmt::print("{:<24} {:>6} {:>12} {:>12}\n", "Phase", "Calls", "Total [s]",
             "Mean [s]");
  fmt::print("{:-<24} {:->6} {:->12} {:->12}\n", "", "", "", "");

  for (const auto &p : phases) {
    double total = p.microseconds / 1000000.0;
    fmt::print("{:<24} {:>6} {:>12.3f} {:>12.3f}\n", p.name, p.calls, total,
               total / static_cast<double>(p.calls));
  }
  fmt::print(fg(fmt::color::cyan),
             "=========================================================\n");
  std::fflush(stdout);
}

std::vector<TimingEntry> TimingCollector::snapshot() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  return entries;
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace voxcut
