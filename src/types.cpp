/**
 * @file types.cpp
 * @brief Event class table, enum names and ScoreMatrix helpers
 */

#include "soundscan/types.hpp"

#include <fmt/core.h>

namespace soundscan {

std::vector<EventClass> default_event_classes() {
  return {{FART_CLASS, "Fart"}, {BURP_CLASS, "Burp"}};
}

std::string event_class_name(int code) {
  for (const auto &c : default_event_classes()) {
    if (c.code == code)
      return c.name;
  }
  return fmt::format("Class {}", code);
}

const char *to_string(BatchPolicy p) {
  switch (p) {
  case BatchPolicy::PROCESS_ALL:
    return "PROCESS_ALL";
  case BatchPolicy::SKIP_LOGGED_PROCESS_NEW:
    return "SKIP_LOGGED_PROCESS_NEW";
  case BatchPolicy::REDOWNLOAD_LOGGED_MISSING:
    return "REDOWNLOAD_LOGGED_MISSING";
  case BatchPolicy::EXIT:
    return "EXIT";
  }
  return "UNKNOWN";
}

std::vector<float> ScoreMatrix::column(std::size_t cls) const {
  if (cls >= classes_) {
    throw std::out_of_range(
        fmt::format("class index {} outside score matrix with {} classes", cls,
                    classes_));
  }
  std::vector<float> out;
  out.reserve(frames_);
  for (std::size_t f = 0; f < frames_; ++f)
    out.push_back(data_[f * classes_ + cls]);
  return out;
}

} // namespace soundscan
