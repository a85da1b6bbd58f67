/**
 * @file options.hpp
 * @brief Command-line options
 */

#ifndef SOUNDSCAN_OPTIONS_HPP
#define SOUNDSCAN_OPTIONS_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace soundscan {

/**
 * @struct Options
 * @brief Per-run settings parsed from argv.
 */
struct Options {
  std::vector<std::string> sources;
  int precision_ms = 1000; //< Pooling window in milliseconds
  int threshold = 20;      //< Confidence threshold in percent
  std::size_t batch_size = DEFAULT_BATCH_SAMPLES;
  std::optional<int> focus_class; //< Single class instead of the defaults
  std::string model_path = "bdetectionmodel_05_01_23.onnx";
  std::string cookies;
  std::optional<BatchPolicy> policy; //< Answer every prompt with this
  bool show_help = false;

  /// Pooling window in model frames (10 ms each), at least 1
  std::size_t precision_frames() const;

  /// Classes to run, in order
  std::vector<EventClass> event_classes() const;
};

/**
 * @brief Parse argv.
 * @throws std::invalid_argument on unknown flags, bad values, conflicting
 *         class selections, or no sources
 */
Options parse_options(int argc, const char *const argv[]);

/**
 * @brief Map a --policy value (all, skip-logged, redownload-missing, exit).
 * @throws std::invalid_argument for anything else
 */
BatchPolicy parse_policy_name(const std::string &name);

std::string usage_text(const char *prog);

} // namespace soundscan

#endif // SOUNDSCAN_OPTIONS_HPP
