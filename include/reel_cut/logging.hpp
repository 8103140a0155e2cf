/**
 * @file logging.hpp
 * @brief Logging macros and per-job timing collection
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Runtime gated LOG_DEBUG (REEL_CUT_DEBUG=1)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector grouping measurements by scope so
 *            concurrent jobs keep separate tables
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so progress is visible while jobs are running.
 */

#ifndef REEL_CUT_LOGGING_HPP
#define REEL_CUT_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "config.hpp"

namespace reel_cut {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(reel_cut::log_mutex);                     \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_DEBUG(format_str, ...)                                             \
  do {                                                                         \
    if (reel_cut::Config::debug_logging()) {                                   \
      std::lock_guard<std::mutex> lock(reel_cut::log_mutex);                   \
      fmt::print(fg(fmt::color::gray), "[DEBUG] " format_str "\n",             \
                 ##__VA_ARGS__);                                               \
      std::fflush(stdout);                                                     \
    }                                                                          \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(reel_cut::log_mutex);                     \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(reel_cut::log_mutex);                     \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(reel_cut::log_mutex);                     \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(reel_cut::log_mutex);                     \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_DEBUG(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 * @note Stores the stage name and duration in microseconds.
 */
struct TimingEntry {
  std::string name;  //< Stage or function name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Thread-safe collector of timing measurements, grouped by scope.
 * @note The pipeline uses the job id as scope, so concurrent jobs never mix
 *       their tables. Entries of a scope are kept in recording order.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::map<std::string, std::vector<TimingEntry>> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param scope Grouping key (job id)
   * @param name Stage or function name
   * @param us Duration in microseconds
   */
  static void record(const std::string &scope, const std::string &name,
                     long us);

  /**
   * @brief Copy of the entries recorded under a scope.
   */
  static std::vector<TimingEntry> entries_for(const std::string &scope);

  /**
   * @brief Print the entries of a scope as a formatted table.
   */
  static void print_summary(const std::string &scope);

  /**
   * @brief Drop all entries of a scope.
   */
  static void clear(const std::string &scope);
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(scope, name)                                                 \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    reel_cut::TimingCollector::record(scope, #name, timer_duration_##name);    \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(scope, name) ((void)0)
#endif

} // namespace reel_cut

#endif // REEL_CUT_LOGGING_HPP
