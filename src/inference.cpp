/**
 * @file inference.cpp
 * @brief Frame splitting and classifier passes
 */

#include "soundscan/inference.hpp"

#include "soundscan/logging.hpp"
#include "soundscan/system.hpp"

namespace soundscan {

std::vector<FrameSpan> split_frames(std::size_t total, std::size_t batch_size,
                                    int sample_rate) {
  std::vector<FrameSpan> frames;
  if (batch_size == 0 || total == 0)
    return frames;

  std::size_t full = total / batch_size;
  frames.reserve(full + 1);
  for (std::size_t i = 0; i < full; ++i)
    frames.push_back({i * batch_size, batch_size});

  std::size_t rest = total % batch_size;
  if (rest > 0 && rest >= static_cast<std::size_t>(sample_rate))
    frames.push_back({full * batch_size, rest});

  return frames;
}

InferenceEngine::InferenceEngine(Classifier &classifier,
                                 std::size_t batch_size, int sample_rate)
    : classifier_(classifier), batch_size_(batch_size),
      sample_rate_(sample_rate) {}

std::size_t InferenceEngine::run_pass(const std::vector<float> &signal,
                                      const FrameCallback &on_frame) {
  auto frames = split_frames(signal.size(), batch_size_, sample_rate_);
  if (frames.empty()) {
    LOG_WARN("Signal of {} samples is shorter than one second; nothing to "
             "classify",
             signal.size());
    return 0;
  }

  const bool report = frames.size() > PROGRESS_EVERY_FRAMES;
  double offset = 0.0;
  for (std::size_t i = 0; i < frames.size(); ++i) {
    const FrameSpan &f = frames[i];
    ScoreMatrix scores = classifier_.infer(signal.data() + f.begin, f.length);
    on_frame(scores, offset);
    offset += static_cast<double>(f.length) / sample_rate_;

    std::size_t done = i + 1;
    if (report && (done % PROGRESS_EVERY_FRAMES == 0 || done == frames.size()))
      LOG_INFO("Classified {}/{} frames ({})", done, frames.size(),
               format_time(offset));
  }
  return frames.size();
}

} // namespace soundscan
