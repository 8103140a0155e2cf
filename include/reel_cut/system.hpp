/**
 * @file system.hpp
 * @brief System utilities: CPU detection, subprocesses and formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Subprocess execution with line streaming (yt-dlp, ffmpeg, curl)
 *
 *          - Shell quoting and time formatting utilities
 */

#ifndef REEL_CUT_SYSTEM_HPP
#define REEL_CUT_SYSTEM_HPP

#include <functional>
#include <string>

namespace reel_cut {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cpuset: `cpuset.cpus.effective` / `cpuset.cpus`
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

// **---- Subprocesses ----**

/**
 * @struct CommandResult
 * @brief Exit status and captured stdout of a shell command.
 */
struct CommandResult {
  int exit_code = -1;  //< Decoded exit code, -1 if the shell could not start
  bool stopped = false; //< Reader stopped early at the caller's request
  std::string output;  //< Captured stdout (stderr too when redirected)
};

/// Receives each output line; return false to stop reading.
using LineCallback = std::function<bool(const std::string &line)>;

/**
 * @brief Run a shell command and capture its output.
 * @param cmd Full command line, already quoted
 * @param on_line Optional per-line callback (also captured in output)
 * @return Exit status and output
 * @note Stopping early closes the pipe, the child then dies on its next write.
 */
CommandResult run_command(const std::string &cmd,
                          const LineCallback &on_line = nullptr);

/**
 * @brief Quote a string for safe inclusion in a POSIX shell command.
 */
std::string shell_quote(const std::string &arg);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

} // namespace reel_cut

#endif // REEL_CUT_SYSTEM_HPP
