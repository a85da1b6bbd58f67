/**
 * @file inference.hpp
 * @brief Frame splitting and per-class classifier passes
 *
 * @details The decoded signal is cut into consecutive frames of batch_size
 *          samples. A trailing partial frame is kept only if it holds at
 *          least one second of audio. Each event class gets its own pass over
 *          all frames; only one frame's scores are alive at a time.
 */

#ifndef SOUNDSCAN_INFERENCE_HPP
#define SOUNDSCAN_INFERENCE_HPP

#include <cstddef>
#include <functional>
#include <vector>

#include "classifier.hpp"
#include "types.hpp"

namespace soundscan {

/// A progress line is logged after every this many frames of a pass
constexpr std::size_t PROGRESS_EVERY_FRAMES = 10;

/**
 * @struct FrameSpan
 * @brief One classifier input: [begin, begin + length) of the signal.
 */
struct FrameSpan {
  std::size_t begin;
  std::size_t length;
};

/**
 * @brief Split @p total samples into frames of @p batch_size.
 * @note The remainder becomes a frame only when it is >= @p sample_rate.
 */
std::vector<FrameSpan> split_frames(std::size_t total, std::size_t batch_size,
                                    int sample_rate);

/**
 * @class InferenceEngine
 * @brief Runs the classifier over every frame of a signal.
 */
class InferenceEngine {
  Classifier &classifier_;
  std::size_t batch_size_;
  int sample_rate_;

public:
  /// Receives each frame's scores and the frame's start offset in seconds
  using FrameCallback =
      std::function<void(const ScoreMatrix &scores, double offset_seconds)>;

  InferenceEngine(Classifier &classifier, std::size_t batch_size,
                  int sample_rate);

  /**
   * @brief One full pass over @p signal.
   * @return Number of frames classified
   * @throws InferenceError from the classifier
   * @note Passes longer than PROGRESS_EVERY_FRAMES log their progress.
   */
  std::size_t run_pass(const std::vector<float> &signal,
                       const FrameCallback &on_frame);
};

} // namespace soundscan

#endif // SOUNDSCAN_INFERENCE_HPP
