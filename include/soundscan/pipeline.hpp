/**
 * @file pipeline.hpp
 * @brief Batch orchestration: resolve, reconcile, acquire, infer, ledger
 *
 * @details The Pipeline class runs one batch end to end:
 *
 *          1. Resolve sources into identifiers and local files
 *
 *          2. Process local files (never ledgered)
 *
 *          3. Snapshot the ledger and asset directory
 *
 *          4. Reconcile, asking at most one batch-level question
 *
 *          5. For each identifier: acquire, decode, run every class pass,
 *             append one ledger row per class
 *
 *          6. Print the summary and write the retry list
 *
 * @note Identifiers are processed strictly one at a time.
 */

#ifndef SOUNDSCAN_PIPELINE_HPP
#define SOUNDSCAN_PIPELINE_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "audio_decoder.hpp"
#include "classifier.hpp"
#include "decision_provider.hpp"
#include "fetcher.hpp"
#include "ledger.hpp"
#include "reference.hpp"
#include "run_context.hpp"
#include "types.hpp"

namespace soundscan {

/**
 * @struct PipelineSettings
 * @brief Paths and inference parameters for one run.
 */
struct PipelineSettings {
  std::string ledger_path;
  std::string asset_dir;
  std::string feed_cache_dir;
  std::string retry_list_path;

  int sample_rate = SAMPLE_RATE;
  std::size_t batch_size = DEFAULT_BATCH_SAMPLES;
  std::size_t precision_frames = MODEL_FRAMES_PER_SECOND;
  int threshold = 20;
  std::vector<EventClass> classes = default_event_classes();
};

/**
 * @struct RunSummary
 * @brief What run() reports back to main().
 */
struct RunSummary {
  int exit_code = 0;
  bool terminated_early = false; //< User chose to stop before processing
  bool batch_mode = false;
  RunCounters counters;
  std::vector<std::string> retry_list;
};

/**
 * @class Pipeline
 * @brief Orchestrates one run over a set of sources.
 */
class Pipeline {
  PipelineSettings settings_;
  Fetcher &fetcher_;
  AudioDecoder &decoder_;
  Classifier &classifier_;
  DecisionProvider &decisions_;

  /**
   * @brief Decode one asset and run every class pass over it.
   * @param ledger_reference Reference to ledger under, or nullptr for local
   *        files
   * @throws DecodeError or InferenceError in single-item mode
   * @throws LedgerError always
   */
  void process_asset(const std::string &path, const std::string &title,
                     const std::string *ledger_reference, LedgerWriter &writer,
                     RunContext &ctx);

  RunSummary resolve_and_execute(const std::vector<std::string> &sources,
                                 bool force_batch);
  RunSummary execute(const ResolvedBatch &batch);

  void print_summary(const RunContext &ctx) const;

  /**
   * @brief Write failed references to the retry list file.
   * @note An empty list removes a file left by an earlier run.
   */
  void write_retry_list(const std::vector<std::string> &refs) const;

public:
  Pipeline(PipelineSettings settings, Fetcher &fetcher, AudioDecoder &decoder,
           Classifier &classifier, DecisionProvider &decisions);

  /**
   * @brief Run the complete pipeline.
   * @return Summary with exit_code 0 on success or clean early exit, 1 on
   *         resolution or ledger errors and single-item failures
   */
  RunSummary run(const std::vector<std::string> &sources);

  /**
   * @brief Run again over references that failed to fetch.
   * @note Always batch mode, so a second failure goes back on the retry list.
   */
  RunSummary retry(const std::vector<std::string> &references);
};

} // namespace soundscan

#endif // SOUNDSCAN_PIPELINE_HPP
