/**
 * @file options.cpp
 * @brief Command-line parsing
 */

#include "soundscan/options.hpp"

#include <stdexcept>

#include <fmt/core.h>

namespace soundscan {

namespace {

int parse_int(const std::string &flag, const std::string &value) {
  size_t pos = 0;
  int v = 0;
  try {
    v = std::stoi(value, &pos);
  } catch (const std::exception &) {
    pos = 0;
  }
  if (pos == 0 || pos != value.size()) {
    throw std::invalid_argument(
        fmt::format("{} expects an integer, got '{}'", flag, value));
  }
  return v;
}

} // anonymous namespace

std::size_t Options::precision_frames() const {
  int frames = precision_ms / (1000 / MODEL_FRAMES_PER_SECOND);
  return static_cast<std::size_t>(frames > 0 ? frames : 1);
}

std::vector<EventClass> Options::event_classes() const {
  if (focus_class)
    return {{*focus_class, event_class_name(*focus_class)}};
  return default_event_classes();
}

BatchPolicy parse_policy_name(const std::string &name) {
  if (name == "all")
    return BatchPolicy::PROCESS_ALL;
  if (name == "skip-logged")
    return BatchPolicy::SKIP_LOGGED_PROCESS_NEW;
  if (name == "redownload-missing")
    return BatchPolicy::REDOWNLOAD_LOGGED_MISSING;
  if (name == "exit")
    return BatchPolicy::EXIT;
  throw std::invalid_argument(fmt::format("Unknown policy '{}'", name));
}

Options parse_options(int argc, const char *const argv[]) {
  Options opt;
  int class_flags = 0;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto value = [&]() -> std::string {
      if (i + 1 >= argc)
        throw std::invalid_argument(fmt::format("{} needs a value", arg));
      return argv[++i];
    };

    if (arg == "-h" || arg == "--help") {
      opt.show_help = true;
    } else if (arg == "--precision") {
      opt.precision_ms = parse_int(arg, value());
      if (opt.precision_ms < 1)
        throw std::invalid_argument("--precision must be positive");
    } else if (arg == "--threshold") {
      opt.threshold = parse_int(arg, value());
      if (opt.threshold < 0 || opt.threshold > 100)
        throw std::invalid_argument("--threshold must be within 0-100");
    } else if (arg == "--batch_size") {
      int n = parse_int(arg, value());
      if (n < 1)
        throw std::invalid_argument("--batch_size must be positive");
      opt.batch_size = static_cast<std::size_t>(n);
    } else if (arg == "--focus_idx") {
      opt.focus_class = parse_int(arg, value());
      if (*opt.focus_class < 0)
        throw std::invalid_argument("--focus_idx must not be negative");
      ++class_flags;
    } else if (arg == "-F") {
      opt.focus_class = FART_CLASS;
      ++class_flags;
    } else if (arg == "-B") {
      opt.focus_class = BURP_CLASS;
      ++class_flags;
    } else if (arg == "--model") {
      opt.model_path = value();
    } else if (arg == "--cookies") {
      opt.cookies = value();
    } else if (arg == "--policy") {
      opt.policy = parse_policy_name(value());
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw std::invalid_argument(fmt::format("Unknown option {}", arg));
    } else {
      opt.sources.push_back(arg);
    }
  }

  if (class_flags > 1)
    throw std::invalid_argument("--focus_idx, -F and -B are mutually exclusive");
  if (opt.sources.empty() && !opt.show_help)
    throw std::invalid_argument("No input given");
  return opt;
}

std::string usage_text(const char *prog) {
  return fmt::format(
      "Usage: {} [options] <source> [<source> ...]\n"
      "\n"
      "Sources: media URL, .txt list of URLs, playlist, channel, account\n"
      "feed, or a local audio/video file.\n"
      "\n"
      "  --precision <ms>      pooling window in milliseconds (default 1000)\n"
      "  --threshold <0-100>   confidence threshold percent (default 20)\n"
      "  --batch_size <n>      frame length in samples (default 960000)\n"
      "  --focus_idx <n>       process one explicit event class\n"
      "  -F                    process class 60 (farts) only\n"
      "  -B                    process class 58 (burps) only\n"
      "  --model <path>        ONNX model (default "
      "bdetectionmodel_05_01_23.onnx)\n"
      "  --cookies <path>      cookie file passed to yt-dlp\n"
      "  --policy <name>       answer prompts non-interactively:\n"
      "                        all | skip-logged | redownload-missing | exit\n"
      "  -h, --help            show this text\n",
      prog);
}

} // namespace soundscan
