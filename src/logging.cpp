/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex
 *
 *          - TimingCollector static members and methods
 */

#include "reel_cut/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace reel_cut {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::map<std::string, std::vector<TimingEntry>> TimingCollector::entries;

void TimingCollector::record(const std::string &scope, const std::string &name,
                             long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries[scope].push_back({name, us});
}

std::vector<TimingEntry> TimingCollector::entries_for(const std::string &scope) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  auto it = entries.find(scope);
  return it == entries.end() ? std::vector<TimingEntry>{} : it->second;
}

void TimingCollector::print_summary(const std::string &scope) {
  std::vector<TimingEntry> rows = entries_for(scope);
  if (rows.empty())
    return;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "============ TIMING SUMMARY [{}] ============\n",
             scope.substr(0, 8));
  fmt::print("{:<30} {:>20}\n", "Stage", "Time (us) [sec]");
  fmt::print("{:-<30} {:-<20}\n", "", "");

  for (const auto &e : rows) {
    double seconds = e.microseconds / 1000000.0;
    fmt::print("{:<30} {:>10} [{:.2f}s]\n", e.name, e.microseconds, seconds);
  }
  fmt::print(fg(fmt::color::cyan),
             "=============================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear(const std::string &scope) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.erase(scope);
}

} // namespace reel_cut
