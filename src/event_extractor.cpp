/**
 * @file event_extractor.cpp
 * @brief Max-pooling and thresholding of classifier scores
 */

#include "soundscan/event_extractor.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/core.h>

#include "soundscan/system.hpp"

namespace soundscan {

std::vector<float> max_pool(const std::vector<float> &series,
                            std::size_t window) {
  if (window == 0)
    window = 1;

  std::vector<float> pooled;
  pooled.reserve((series.size() + window - 1) / window);
  for (std::size_t start = 0; start < series.size(); start += window) {
    std::size_t end = std::min(start + window, series.size());
    pooled.push_back(
        *std::max_element(series.begin() + start, series.begin() + end));
  }
  return pooled;
}

std::vector<EventDetection> extract_events(const ScoreMatrix &scores,
                                           std::size_t class_index,
                                           std::size_t precision,
                                           double offset_seconds,
                                           double threshold) {
  if (precision == 0)
    precision = 1;

  std::vector<float> pooled = max_pool(scores.column(class_index), precision);

  std::vector<EventDetection> events;
  const double window_seconds =
      static_cast<double>(precision) / MODEL_FRAMES_PER_SECOND;
  for (std::size_t i = 0; i < pooled.size(); ++i) {
    /// Round off float32 noise (0.95f * 100 = 94.99999...) before truncating
    double percent =
        std::round(static_cast<double>(pooled[i]) * 100.0 * 1e4) / 1e4;
    if (percent >= threshold) {
      events.push_back({offset_seconds + i * window_seconds,
                        static_cast<int>(percent)});
    }
  }
  return events;
}

std::string format_detection(const EventDetection &d) {
  return fmt::format("{} {}%", format_time(d.timestamp_seconds),
                     d.confidence_percent);
}

} // namespace soundscan
