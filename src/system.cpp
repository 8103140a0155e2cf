/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - popen based subprocess execution
 *
 *          - Shell quoting and time formatting utilities
 */

#include "reel_cut/system.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <string>
#include <thread>

#include <sys/wait.h>

#include <fmt/core.h>

namespace reel_cut {

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.good() ? val : -1;
}

/// Count CPUs in a cpuset string like "0,2,4,6" or "0-3"
int count_cpuset_string(const std::string &line) {
  int count = 0;
  size_t pos = 0;
  while (pos < line.size()) {
    size_t end = line.find(',', pos);
    if (end == std::string::npos)
      end = line.size();
    std::string part = line.substr(pos, end - pos);
    size_t dash = part.find('-');
    try {
      if (dash == std::string::npos) {
        std::stoi(part);
        ++count;
      } else {
        int lo = std::stoi(part.substr(0, dash));
        int hi = std::stoi(part.substr(dash + 1));
        count += std::max(0, hi - lo + 1);
      }
    } catch (const std::exception &) {
      return -1;
    }
    pos = end + 1;
  }
  return count > 0 ? count : -1;
}

/// Helper to count CPUs from a cpuset file
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  return count_cpuset_string(line);
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// Try cgroup v2 first (unified hierarchy)
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && !period_str.empty()) {
        long quota = std::stol(quota_str);
        long period = std::stol(period_str);
        if (quota > 0 && period > 0) {
          limit = static_cast<int>((quota + period - 1) / period);
        }
      }
    }
  }

  /// Try cgroup v1 CPU quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0) {
      limit = static_cast<int>((quota + period - 1) / period);
    }
  }

  /// Try cpuset (counts actual allowed cores)
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0) {
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
    }
  }

  /// Fallback to hardware_concurrency
  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }

  /// Sanity checks
  if (limit <= 0)
    limit = 4;
  if (limit > 64)
    limit = 64;

  return limit;
}

// **---- Subprocesses ----**

CommandResult run_command(const std::string &cmd, const LineCallback &on_line) {
  CommandResult result;

  FILE *pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    return result;
  }

  std::string line;
  char buf[4096];
  while (std::fgets(buf, sizeof(buf), pipe)) {
    line += buf;
    if (line.empty() || line.back() != '\n')
      continue; //< Partial line, keep reading

    result.output += line;
    line.pop_back();
    if (!line.empty() && line.back() == '\r')
      line.pop_back();

    if (on_line && !on_line(line)) {
      result.stopped = true;
      line.clear();
      break;
    }
    line.clear();
  }
  if (!line.empty()) {
    result.output += line;
    if (on_line && !result.stopped && !on_line(line))
      result.stopped = true;
  }

  int status = pclose(pipe);
  if (status == -1) {
    result.exit_code = -1;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else {
    result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
  }
  return result;
}

std::string shell_quote(const std::string &arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  quoted += "'";
  return quoted;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace reel_cut
