/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - popen-based subprocess capture
 *
 *          - Time formatting utilities
 */

#include "soundscan/system.hpp"

#include <cstdio>
#include <ctime>
#include <fstream>
#include <string>
#include <thread>

#include <sys/wait.h>

#include <fmt/chrono.h>
#include <fmt/core.h>

namespace soundscan {

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

/// Count the CPUs in a cpuset string like "0,2,4,6,8" or "0-3"
int count_cpuset_string(const std::string &line) {
  int count = 0;
  size_t pos = 0;
  while (pos < line.size()) {
    size_t end = line.find_first_of(",-", pos);
    if (end == std::string::npos)
      end = line.size();

    int start_cpu = std::stoi(line.substr(pos, end - pos));

    if (end < line.size() && line[end] == '-') {
      /// Range like "0-3"
      pos = end + 1;
      end = line.find(',', pos);
      if (end == std::string::npos)
        end = line.size();
      int end_cpu = std::stoi(line.substr(pos, end - pos));
      count += end_cpu - start_cpu + 1;
    } else {
      ++count;
    }

    pos = (end < line.size()) ? end + 1 : line.size();
  }
  return count;
}

/// Helper to count CPUs from a cpuset file
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  if (line.empty())
    return -1;
  int n = count_cpuset_string(line);
  return n > 0 ? n : -1;
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

std::string shell_quote(const std::string &arg) {
  std::string out;
  out.reserve(arg.size() + 2);
  out += '\'';
  for (char c : arg) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += '\'';
  return out;
}

CommandResult run_command(const std::string &cmd) {
  CommandResult result;

  FILE *pipe = popen(cmd.c_str(), "r");
  if (!pipe)
    return result;

  char buffer[4096];
  while (std::fgets(buffer, sizeof(buffer), pipe)) {
    result.output += buffer;
  }

  int status = pclose(pipe);
  if (status == -1) {
    result.exit_code = -1;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else {
    /// Killed by a signal
    result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
  }
  return result;
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t end = text.find('\n', pos);
    if (end == std::string::npos)
      end = text.size();
    std::string line = text.substr(pos, end - pos);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (!line.empty())
      lines.push_back(std::move(line));
    pos = end + 1;
  }
  return lines;
}

bool executable_available(const std::string &binary) {
  std::string cmd =
      fmt::format("command -v {} >/dev/null 2>&1", shell_quote(binary));
  return run_command(cmd).exit_code == 0;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string current_timestamp() {
  std::time_t now = std::time(nullptr);
  return fmt::format("{:%d/%m/%Y_%H:%M:%S}", fmt::localtime(now));
}

} // namespace soundscan
