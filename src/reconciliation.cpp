/**
 * @file reconciliation.cpp
 * @brief Batch reconciliation implementation
 */

#include "soundscan/reconciliation.hpp"

#include <algorithm>

#include <fmt/color.h>
#include <fmt/core.h>

#include "soundscan/logging.hpp"

namespace soundscan {

std::size_t ReconciliationPlan::actionable() const {
  return static_cast<std::size_t>(
      std::count_if(dispositions.begin(), dispositions.end(),
                    [](const std::pair<Identifier, Disposition> &d) {
                      return d.second != Disposition::SKIP;
                    }));
}

BatchCounts count_batch(const std::vector<Identifier> &ids,
                        const LedgerSnapshot &ledger,
                        const AssetIndex &assets) {
  BatchCounts c;
  c.total = ids.size();
  for (const auto &id : ids) {
    bool logged = ledger.logged_any(id);
    bool cached = assets.contains(id);
    if (logged)
      ++c.logged;
    if (cached)
      ++c.cached;
    if (logged && !cached)
      ++c.logged_but_missing;
    if (cached && !logged)
      ++c.cached_but_not_logged;
  }
  c.to_process = c.total > c.logged ? c.total - c.logged : 0;
  return c;
}

Disposition derive_disposition(bool logged, bool cached,
                               std::optional<BatchPolicy> policy) {
  if (policy == BatchPolicy::EXIT)
    return Disposition::SKIP;

  if (!logged)
    return cached ? Disposition::REUSE_EXISTING : Disposition::DOWNLOAD_NEW;

  if (!policy) {
    return cached ? Disposition::REUSE_EXISTING
                  : Disposition::REDOWNLOAD_MISSING;
  }

  switch (*policy) {
  case BatchPolicy::PROCESS_ALL:
    return cached ? Disposition::REINFER_EXISTING
                  : Disposition::REDOWNLOAD_MISSING;
  case BatchPolicy::SKIP_LOGGED_PROCESS_NEW:
    return Disposition::SKIP;
  case BatchPolicy::REDOWNLOAD_LOGGED_MISSING:
    return cached ? Disposition::SKIP : Disposition::REDOWNLOAD_MISSING;
  case BatchPolicy::EXIT:
    break;
  }
  return Disposition::SKIP;
}

ReconciliationPlan reconcile(const std::vector<Identifier> &ids,
                             const LedgerSnapshot &ledger,
                             const AssetIndex &assets,
                             DecisionProvider &decisions) {
  ReconciliationPlan plan;
  plan.counts = count_batch(ids, ledger, assets);
  const BatchCounts &c = plan.counts;

  // **---- Batch-level decision ----**

  if (c.total > 0 && c.logged == c.total && c.cached == c.total) {
    if (!decisions.confirm_rerun_all(c)) {
      LOG_INFO("Process terminated by user.");
      plan.terminate = true;
      return plan;
    }
    LOG_INFO("Re-running inference for all items.");
    plan.policy = BatchPolicy::PROCESS_ALL;
  } else if (c.logged > 0 &&
             (c.logged_but_missing > 0 || c.cached_but_not_logged > 0 ||
              c.to_process != c.total)) {
    BatchPolicy p = decisions.choose_batch_policy(c);
    switch (p) {
    case BatchPolicy::EXIT:
      LOG_INFO("Process terminated by user.");
      plan.terminate = true;
      break;
    case BatchPolicy::REDOWNLOAD_LOGGED_MISSING:
      if (c.logged_but_missing == 0) {
        LOG_SUCCESS("No logged items are missing their files. Nothing to do.");
        plan.terminate = true;
      } else {
        LOG_INFO("Re-downloading only missing files.");
      }
      break;
    case BatchPolicy::SKIP_LOGGED_PROCESS_NEW:
      if (c.to_process == 0) {
        LOG_SUCCESS("No new items require processing. Nothing to do.");
        plan.terminate = true;
      } else {
        LOG_INFO("Skipping logged items and processing only new ones.");
      }
      break;
    case BatchPolicy::PROCESS_ALL:
      LOG_INFO("Processing all items (new + missing + existing).");
      break;
    }
    plan.policy = p;
    if (plan.terminate)
      return plan;
  }

  plan.full_rerun = (plan.policy == BatchPolicy::PROCESS_ALL);

  // **---- Per-identifier dispositions ----**

  plan.dispositions.reserve(ids.size());
  for (const auto &id : ids) {
    plan.dispositions.emplace_back(
        id, derive_disposition(ledger.logged_any(id), assets.contains(id),
                               plan.policy));
  }
  return plan;
}

void print_batch_counts(const BatchCounts &c) {
  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "============ SUMMARY BEFORE PROCESSING =============\n");
  fmt::print("{:<38} {:>12}\n", "Total items", c.total);
  fmt::print("{:<38} {:>12}\n", "Already processed (in ledger)", c.logged);
  fmt::print("{:<38} {:>12}\n", "Existing files found", c.cached);
  fmt::print("{:<38} {:>12}\n", "Logged items with missing files",
             c.logged_but_missing);
  fmt::print("{:<38} {:>12}\n", "Existing files not in ledger",
             c.cached_but_not_logged);
  fmt::print("{:<38} {:>12}\n", "Items requiring processing", c.to_process);
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

} // namespace soundscan
