/**
 * @file reconciliation.hpp
 * @brief Ledger/cache reconciliation for a batch of identifiers
 *
 * @details Before anything is downloaded or decoded, the batch is compared
 *          against the ledger and asset snapshots:
 *
 *          1. Every identifier logged and cached -> one "re-run all?" question
 *
 *          2. Some logged plus any inconsistency -> one four-way policy choice
 *
 *          3. Otherwise -> no question, no policy
 *
 *          The result assigns exactly one Disposition per identifier.
 */

#ifndef SOUNDSCAN_RECONCILIATION_HPP
#define SOUNDSCAN_RECONCILIATION_HPP

#include <optional>
#include <vector>

#include "asset_index.hpp"
#include "decision_provider.hpp"
#include "ledger.hpp"
#include "types.hpp"

namespace soundscan {

/**
 * @struct ReconciliationPlan
 * @brief Output of reconcile(): what to do with each identifier.
 */
struct ReconciliationPlan {
  bool terminate = false;            //< Clean early exit, nothing to do
  std::optional<BatchPolicy> policy; //< Absent when no ambiguity existed
  bool full_rerun = false;           //< PROCESS_ALL was chosen
  BatchCounts counts;
  std::vector<std::pair<Identifier, Disposition>> dispositions; //< Input order

  std::size_t actionable() const;
};

/**
 * @brief Compute batch counts from the two snapshots.
 */
BatchCounts count_batch(const std::vector<Identifier> &ids,
                        const LedgerSnapshot &ledger, const AssetIndex &assets);

/**
 * @brief Disposition for one identifier. Total over every input.
 * @note EXIT maps to SKIP; the run never reaches the table with it.
 */
Disposition derive_disposition(bool logged, bool cached,
                               std::optional<BatchPolicy> policy);

/**
 * @brief Reconcile a batch, asking @p decisions at most one question.
 */
ReconciliationPlan reconcile(const std::vector<Identifier> &ids,
                             const LedgerSnapshot &ledger,
                             const AssetIndex &assets,
                             DecisionProvider &decisions);

/**
 * @brief Log the pre-processing summary table.
 */
void print_batch_counts(const BatchCounts &counts);

} // namespace soundscan

#endif // SOUNDSCAN_RECONCILIATION_HPP
