/**
 * @file system.hpp
 * @brief System utilities, CPU detection and subprocess helpers
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Shell quoting and captured subprocess execution
 *
 *          - Time formatting utilities
 *
 * @note For Docker containers, CPU discovery respects cgroup limits set by
 *       docker-compose or docker run --cpus flags.
 */

#ifndef SOUNDSCAN_SYSTEM_HPP
#define SOUNDSCAN_SYSTEM_HPP

#include <string>
#include <vector>

namespace soundscan {

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
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cpuset: `/sys/fs/cgroup/cpuset/cpuset.cpus` (counts allowed cores)
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

// **---- Subprocesses ----**

/**
 * @struct CommandResult
 * @brief Exit status and captured stdout of a finished command.
 */
struct CommandResult {
  int exit_code = -1; //< Decoded exit code (-1 = could not launch)
  std::string output; //< Everything the command wrote to stdout
};

/**
 * @brief Quote a single argument for /bin/sh.
 */
std::string shell_quote(const std::string &arg);

/**
 * @brief Run a shell command and capture its stdout.
 * @note stderr is left attached to the terminal so tool diagnostics stay
 *       visible.
 */
CommandResult run_command(const std::string &cmd);

/**
 * @brief Split command output into non-empty lines (trailing CR stripped).
 */
std::vector<std::string> split_lines(const std::string &text);

/**
 * @brief Check that an executable can be found on PATH (or at its path).
 */
bool executable_available(const std::string &binary);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/**
 * @brief Current local time as "%d/%m/%Y_%H:%M:%S".
 */
std::string current_timestamp();

} // namespace soundscan

#endif // SOUNDSCAN_SYSTEM_HPP
