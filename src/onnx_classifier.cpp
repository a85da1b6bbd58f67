/**
 * @file onnx_classifier.cpp
 * @brief ONNX Runtime backed classifier
 */

#include "soundscan/classifier.hpp"

#include <cstdint>

#include <onnxruntime_cxx_api.h>

#include <fmt/core.h>

#include "soundscan/errors.hpp"
#include "soundscan/logging.hpp"

namespace soundscan {

OnnxClassifier::OnnxClassifier(const std::string &model_path,
                               int num_threads) {
  try {
    env_ = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "soundscan");

    session_options_ = std::make_unique<Ort::SessionOptions>();
    session_options_->SetIntraOpNumThreads(num_threads > 0 ? num_threads : 1);
    session_options_->SetGraphOptimizationLevel(
        GraphOptimizationLevel::ORT_ENABLE_ALL);

    session_ = std::make_unique<Ort::Session>(*env_, model_path.c_str(),
                                              *session_options_);

    Ort::AllocatorWithDefaultOptions allocator;
    if (session_->GetInputCount() < 1 || session_->GetOutputCount() < 1) {
      throw InferenceError(
          fmt::format("Model {} has no inputs or outputs", model_path));
    }
    input_name_ = session_->GetInputNameAllocated(0, allocator).get();
    output_name_ = session_->GetOutputNameAllocated(0, allocator).get();

    memory_info_ = std::make_unique<Ort::MemoryInfo>(
        Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault));
  } catch (const Ort::Exception &e) {
    throw InferenceError(
        fmt::format("Failed to load model {}: {}", model_path, e.what()));
  }

  LOG_INFO("Model loaded: {} (input '{}', output '{}', {} threads)",
           model_path, input_name_, output_name_, num_threads);
}

OnnxClassifier::~OnnxClassifier() = default;

ScoreMatrix OnnxClassifier::infer(const float *samples, std::size_t count) {
  if (!samples || count == 0)
    throw InferenceError("Empty frame passed to classifier");

  try {
    std::vector<int64_t> input_shape = {1, static_cast<int64_t>(count)};

    /// ONNX Runtime does not write to input tensors
    Ort::Value input = Ort::Value::CreateTensor<float>(
        *memory_info_, const_cast<float *>(samples), count,
        input_shape.data(), input_shape.size());

    const char *input_names[] = {input_name_.c_str()};
    const char *output_names[] = {output_name_.c_str()};

    auto outputs = session_->Run(Ort::RunOptions{nullptr}, input_names, &input,
                                 1, output_names, 1);

    auto shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
    std::size_t frames = 0;
    std::size_t classes = 0;
    if (shape.size() == 3 && shape[0] == 1) {
      frames = static_cast<std::size_t>(shape[1]);
      classes = static_cast<std::size_t>(shape[2]);
    } else if (shape.size() == 2) {
      frames = static_cast<std::size_t>(shape[0]);
      classes = static_cast<std::size_t>(shape[1]);
    } else {
      throw InferenceError(
          fmt::format("Unexpected model output rank {}", shape.size()));
    }

    const float *data = outputs[0].GetTensorData<float>();
    return ScoreMatrix(frames, classes,
                       std::vector<float>(data, data + frames * classes));
  } catch (const Ort::Exception &e) {
    throw InferenceError(fmt::format("ONNX Runtime error: {}", e.what()));
  }
}

} // namespace soundscan
