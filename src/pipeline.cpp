/**
 * @file pipeline.cpp
 * @brief Pipeline orchestration implementation
 */

#include "soundscan/pipeline.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

#include <fmt/color.h>
#include <fmt/core.h>

#include "soundscan/acquisition.hpp"
#include "soundscan/asset_index.hpp"
#include "soundscan/errors.hpp"
#include "soundscan/event_extractor.hpp"
#include "soundscan/inference.hpp"
#include "soundscan/logging.hpp"
#include "soundscan/reconciliation.hpp"
#include "soundscan/reference.hpp"
#include "soundscan/system.hpp"

namespace soundscan {

namespace {

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

void print_detections(const std::vector<EventDetection> &events) {
  if (events.empty())
    return;
  std::lock_guard<std::mutex> lock(log_mutex);
  for (const auto &e : events)
    fmt::print("{}\n", format_detection(e));
  std::fflush(stdout);
}

} // anonymous namespace

Pipeline::Pipeline(PipelineSettings settings, Fetcher &fetcher,
                   AudioDecoder &decoder, Classifier &classifier,
                   DecisionProvider &decisions)
    : settings_(std::move(settings)), fetcher_(fetcher), decoder_(decoder),
      classifier_(classifier), decisions_(decisions) {}

// **---- Per-asset processing ----**

void Pipeline::process_asset(const std::string &path, const std::string &title,
                             const std::string *ledger_reference,
                             LedgerWriter &writer, RunContext &ctx) {
  LOG_INFO("Title: {}", title);
  LOG_INFO("Starting inference for: {}", path);

  InferenceEngine engine(classifier_, settings_.batch_size,
                         settings_.sample_rate);

  try {
    TIMER_START(decode);
    std::vector<float> signal = decoder_.decode(path);
    TIMER_END(decode);
    LOG_SUCCESS("Audio loaded: {} samples ({})", signal.size(),
                format_time(static_cast<double>(signal.size()) /
                            settings_.sample_rate));

    for (const auto &cls : settings_.classes) {
      LOG_HEADER("\n{}", upper(cls.name));

      TIMER_START(inference);
      engine.run_pass(signal, [&](const ScoreMatrix &scores, double offset) {
        if (static_cast<std::size_t>(cls.code) >= scores.classes()) {
          throw InferenceError(fmt::format(
              "Class {} not in model output ({} classes)", cls.code,
              scores.classes()));
        }
        print_detections(extract_events(
            scores, static_cast<std::size_t>(cls.code),
            settings_.precision_frames, offset, settings_.threshold));
      });
      TIMER_END(inference);

      if (ledger_reference) {
        writer.append(*ledger_reference, cls.code, current_timestamp(), title);
      }
    }
  } catch (const DecodeError &e) {
    ++ctx.counters.decode_failures;
    LOG_ERROR("{}", e.what());
    if (!ctx.batch_mode)
      throw;
    return;
  } catch (const InferenceError &e) {
    ++ctx.counters.decode_failures;
    LOG_ERROR("Inference failed for {}: {}", path, e.what());
    if (!ctx.batch_mode)
      throw;
    return;
  }

  ++ctx.counters.inferenced;
  LOG_SUCCESS("Inference completed for this file!");
}

// **---- Run ----**

RunSummary Pipeline::run(const std::vector<std::string> &sources) {
  return resolve_and_execute(sources, false);
}

RunSummary Pipeline::retry(const std::vector<std::string> &references) {
  return resolve_and_execute(references, true);
}

RunSummary Pipeline::resolve_and_execute(const std::vector<std::string> &sources,
                                         bool force_batch) {
  LOG_PHASE("=== Resolving sources ===");
  ReferenceResolver resolver(fetcher_, settings_.feed_cache_dir);
  ResolvedBatch batch;
  try {
    batch = resolver.resolve(sources);
  } catch (const ResolutionError &e) {
    LOG_ERROR("{}", e.what());
    RunSummary summary;
    summary.exit_code = 1;
    return summary;
  }
  if (force_batch)
    batch.batch_mode = true;
  return execute(batch);
}

RunSummary Pipeline::execute(const ResolvedBatch &batch) {
  RunSummary summary;
  RunContext ctx;
  ctx.batch_mode = batch.batch_mode;
  summary.batch_mode = batch.batch_mode;

  LedgerWriter writer(settings_.ledger_path);

  try {
    // **---- Local files ----**

    for (const auto &file : batch.local_files) {
      ++ctx.counters.total;
      LOG_PHASE("Processing local file: {}", file);
      process_asset(file, std::filesystem::path(file).filename().string(),
                    nullptr, writer, ctx);
      if (ctx.batch_mode)
        TimingCollector::clear();
    }

    // **---- Remote items ----**

    if (!batch.identifiers.empty()) {
      LOG_PHASE("=== Reconciling {} items ===", batch.identifiers.size());
      LedgerSnapshot ledger = LedgerSnapshot::load(settings_.ledger_path);
      AssetIndex assets =
          AssetIndex::scan(settings_.asset_dir, batch.identifiers);

      BatchCounts counts = count_batch(batch.identifiers, ledger, assets);
      if (ctx.batch_mode)
        print_batch_counts(counts);

      ReconciliationPlan plan =
          reconcile(batch.identifiers, ledger, assets, decisions_);
      if (plan.terminate) {
        summary.terminated_early = true;
        summary.counters = ctx.counters;
        return summary;
      }
      ctx.full_rerun = plan.full_rerun;
      LOG_INFO("Items to process: {} out of {}", plan.actionable(),
               plan.dispositions.size());

      AcquisitionCoordinator acquisition(fetcher_, decisions_, assets, ledger);

      std::size_t index = 0;
      for (const auto &[id, disposition] : plan.dispositions) {
        ++index;
        ++ctx.counters.total;
        const std::string &reference = batch.reference_of(id);
        LOG_PHASE("\nProcessing item {} of {}: {}", index,
                  plan.dispositions.size(), reference);

        auto asset = acquisition.acquire(id, reference, disposition, ctx);
        if (!asset)
          continue;

        process_asset(asset->path, asset->title, &reference, writer, ctx);
        if (ctx.batch_mode)
          TimingCollector::clear();
      }
    }
  } catch (const LedgerError &e) {
    LOG_ERROR("Ledger failure: {}", e.what());
    summary.exit_code = 1;
  } catch (const FetchError &e) {
    LOG_ERROR("Failed to fetch {}: {}", e.reference(), e.what());
    summary.exit_code = 1;
  } catch (const DecodeError &) {
    summary.exit_code = 1;
  } catch (const InferenceError &) {
    summary.exit_code = 1;
  }

  if (ctx.batch_mode) {
    print_summary(ctx);
  } else {
    TimingCollector::print_summary();
  }
  if (summary.exit_code == 0 || !ctx.retry_list.empty())
    write_retry_list(ctx.retry_list);

  summary.counters = ctx.counters;
  summary.retry_list = ctx.retry_list;
  return summary;
}

// **---- Reporting ----**

void Pipeline::print_summary(const RunContext &ctx) const {
  const RunCounters &c = ctx.counters;
  {
    std::lock_guard<std::mutex> lock(log_mutex);
    fmt::print("\n");
    fmt::print(fg(fmt::color::cyan),
               "================== RUN SUMMARY =====================\n");
    fmt::print("{:<38} {:>12}\n", "Total items processed:", c.total);
    fmt::print("{:<38} {:>12}\n", "Items inferenced:", c.inferenced);
    fmt::print("{:<38} {:>12}\n", "Previously existing files used:",
               c.existing_used);
    fmt::print("{:<38} {:>12}\n", "Newly downloaded:", c.new_downloads);
    fmt::print("{:<38} {:>12}\n", "Skipped:", c.skipped);
    fmt::print("{:<38} {:>12}\n", "Failed downloads:", c.fetch_failures);
    fmt::print("{:<38} {:>12}\n", "Failed decodes:", c.decode_failures);
    fmt::print(fg(fmt::color::cyan),
               "====================================================\n");

    if (!ctx.retry_list.empty()) {
      fmt::print(fg(fmt::color::red), "\nFailed references:\n");
      for (const auto &ref : ctx.retry_list)
        fmt::print(fg(fmt::color::red), "  - {}\n", ref);
    }
    std::fflush(stdout);
  }
}

void Pipeline::write_retry_list(const std::vector<std::string> &refs) const {
  if (settings_.retry_list_path.empty())
    return;

  if (refs.empty()) {
    /// Nothing failed: a list left by an earlier run is stale
    std::error_code ec;
    if (std::filesystem::remove(settings_.retry_list_path, ec))
      LOG_INFO("Removed stale retry list {}", settings_.retry_list_path);
    else if (ec)
      LOG_WARN("Could not remove retry list {}: {}", settings_.retry_list_path,
               ec.message());
    return;
  }

  std::ofstream out(settings_.retry_list_path, std::ios::trunc);
  if (!out) {
    LOG_WARN("Could not write retry list {}", settings_.retry_list_path);
    return;
  }
  for (const auto &r : refs)
    out << r << '\n';
  LOG_INFO("Failed references saved to {}", settings_.retry_list_path);
}

} // namespace soundscan
