/**
 * @file main.cpp
 * @brief Entry point for SoundScan
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - External tool checks (ffmpeg, yt-dlp)
 *
 *          - Model loading and wiring of the pipeline collaborators
 *
 *          - The retry loop over references that failed to fetch
 *
 * @note Paths and tool locations come from environment variables (see
 *       config.hpp). Pass --policy to run without prompts.
 */

#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "soundscan/audio_decoder.hpp"
#include "soundscan/classifier.hpp"
#include "soundscan/config.hpp"
#include "soundscan/decision_provider.hpp"
#include "soundscan/errors.hpp"
#include "soundscan/fetcher.hpp"
#include "soundscan/logging.hpp"
#include "soundscan/options.hpp"
#include "soundscan/pipeline.hpp"
#include "soundscan/system.hpp"

using namespace soundscan;

namespace {

bool check_dependencies() {
  std::vector<std::string> missing;
  for (const auto &bin : {Config::ffmpeg_bin(), Config::ytdlp_bin()}) {
    if (!executable_available(bin))
      missing.push_back(bin);
  }
  if (missing.empty())
    return true;

  LOG_ERROR("Missing dependencies detected:");
  for (const auto &m : missing)
    LOG_ERROR("   - {}", m);
  LOG_WARN("Install them or point FFMPEG_BIN / YTDLP_BIN at them.");
  return false;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering so prompts and child output interleave
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  Options opt;
  try {
    opt = parse_options(argc, argv);
  } catch (const std::invalid_argument &e) {
    LOG_ERROR("{}", e.what());
    fmt::print("{}", usage_text(argv[0]));
    return 2;
  }
  if (opt.show_help) {
    fmt::print("{}", usage_text(argv[0]));
    return 0;
  }

  if (!check_dependencies())
    return 1;

  PipelineSettings settings;
  settings.ledger_path = Config::ledger_path();
  settings.asset_dir = Config::asset_dir();
  settings.feed_cache_dir = Config::feed_cache_dir();
  settings.retry_list_path = Config::retry_list_path();
  settings.batch_size = opt.batch_size;
  settings.precision_frames = opt.precision_frames();
  settings.threshold = opt.threshold;
  settings.classes = opt.event_classes();

  int threads = Config::inference_threads();
  if (threads <= 0)
    threads = detect_cpu_limit();

  std::unique_ptr<OnnxClassifier> classifier;
  try {
    classifier = std::make_unique<OnnxClassifier>(opt.model_path, threads);
  } catch (const InferenceError &e) {
    LOG_ERROR("{}", e.what());
    return 1;
  }

  YtDlpFetcher fetcher(Config::ytdlp_bin(), opt.cookies);
  FfmpegDecoder decoder(Config::ffmpeg_bin(), SAMPLE_RATE,
                        static_cast<std::size_t>(Config::decode_chunk_samples()));

  std::unique_ptr<DecisionProvider> decisions;
  if (opt.policy) {
    LOG_INFO("Non-interactive run, policy {}", to_string(*opt.policy));
    decisions = std::make_unique<ScriptedDecisionProvider>(
        ScriptedDecisionProvider::for_policy(*opt.policy));
  } else {
    decisions = std::make_unique<ConsoleDecisionProvider>(std::cin, std::cout);
  }

  Pipeline pipeline(settings, fetcher, decoder, *classifier, *decisions);

  RunSummary summary = pipeline.run(opt.sources);
  while (summary.exit_code == 0 && !summary.retry_list.empty()) {
    if (!decisions->confirm_retry(summary.retry_list)) {
      LOG_INFO("Skipping retry. Failed references are in {}",
               settings.retry_list_path);
      return 0;
    }

    LOG_INFO("Retrying {} failed references", summary.retry_list.size());
    summary = pipeline.retry(summary.retry_list);
  }
  return summary.exit_code;
}
