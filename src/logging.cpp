/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex
 *
 *          - TimingCollector static members and methods
 */

#include "soundscan/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace soundscan {

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

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<30} {:>20}\n", "Phase", "Time (us) [sec]");
  fmt::print("{:-<30} {:-<20}\n", "", "");

  long total = 0;
  for (const auto &e : entries) {
    fmt::print("{:<30} {:>10} [{:.2f}s]\n", e.name, e.microseconds,
               e.microseconds / 1000000.0);
    total += e.microseconds;
  }
  fmt::print("{:-<30} {:-<20}\n", "", "");
  fmt::print("{:<30} {:>10} [{:.2f}s]\n", "total", total, total / 1000000.0);
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace soundscan
