/**
 * @file event_extractor.hpp
 * @brief Framewise scores -> pooled, thresholded, timestamped events
 */

#ifndef SOUNDSCAN_EVENT_EXTRACTOR_HPP
#define SOUNDSCAN_EVENT_EXTRACTOR_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "types.hpp"

namespace soundscan {

/**
 * @brief Max-pool @p series over non-overlapping windows of @p window.
 * @note The last, shorter window is pooled on its own, giving
 *       ceil(size / window) values.
 */
std::vector<float> max_pool(const std::vector<float> &series,
                            std::size_t window);

/**
 * @brief Detections for one class in one frame.
 *
 * @param scores Frame output of the classifier
 * @param class_index Column of the class in @p scores
 * @param precision Model frames per pooled window (>= 1)
 * @param offset_seconds Start of the frame within the asset
 * @param threshold Minimum confidence in percent (0-100)
 * @return Detections in ascending timestamp order
 * @throws std::out_of_range if @p class_index is not in @p scores
 */
std::vector<EventDetection> extract_events(const ScoreMatrix &scores,
                                           std::size_t class_index,
                                           std::size_t precision,
                                           double offset_seconds,
                                           double threshold);

/// "HH:MM:SS NN%"
std::string format_detection(const EventDetection &d);

} // namespace soundscan

#endif // SOUNDSCAN_EVENT_EXTRACTOR_HPP
