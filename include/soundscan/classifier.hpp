/**
 * @file classifier.hpp
 * @brief Framewise audio event classifier interface and ONNX backend
 *
 * @details A Classifier maps one mono PCM frame (input shape [1, N]) to a
 *          frames x classes score matrix. The model emits
 *          MODEL_FRAMES_PER_SECOND output frames per second of input.
 */

#ifndef SOUNDSCAN_CLASSIFIER_HPP
#define SOUNDSCAN_CLASSIFIER_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "types.hpp"

namespace Ort {
struct Env;
struct Session;
struct SessionOptions;
struct MemoryInfo;
} // namespace Ort

namespace soundscan {

/**
 * @class Classifier
 * @brief Boundary to the pretrained model.
 */
class Classifier {
public:
  virtual ~Classifier() = default;

  /// @throws InferenceError
  virtual ScoreMatrix infer(const float *samples, std::size_t count) = 0;
};

/**
 * @class OnnxClassifier
 * @brief Classifier running an ONNX model through ONNX Runtime.
 *
 * @attention Accepts model outputs shaped [1, frames, classes] or
 *            [frames, classes].
 */
class OnnxClassifier : public Classifier {
  std::unique_ptr<Ort::Env> env_;
  std::unique_ptr<Ort::SessionOptions> session_options_;
  std::unique_ptr<Ort::Session> session_;
  std::unique_ptr<Ort::MemoryInfo> memory_info_;

  std::string input_name_;
  std::string output_name_;

public:
  /**
   * @param model_path Path to the .onnx file
   * @param num_threads Intra-op threads (> 0)
   * @throws InferenceError if the model cannot be loaded
   */
  OnnxClassifier(const std::string &model_path, int num_threads);
  ~OnnxClassifier() override;

  OnnxClassifier(const OnnxClassifier &) = delete;
  OnnxClassifier &operator=(const OnnxClassifier &) = delete;

  ScoreMatrix infer(const float *samples, std::size_t count) override;
};

} // namespace soundscan

#endif // SOUNDSCAN_CLASSIFIER_HPP
