/**
 * @file acquisition.hpp
 * @brief Obtains the local audio file for one identifier
 *
 * @details Given the disposition decided by reconciliation, either returns
 *          the cached file, asks about it, or fetches a new one.
 *
 * @attention Failures to fetch are recorded in the run's retry list in batch
 *            mode and rethrown as FetchError in single-item mode.
 */

#ifndef SOUNDSCAN_ACQUISITION_HPP
#define SOUNDSCAN_ACQUISITION_HPP

#include <optional>
#include <string>

#include "asset_index.hpp"
#include "decision_provider.hpp"
#include "fetcher.hpp"
#include "ledger.hpp"
#include "run_context.hpp"
#include "types.hpp"

namespace soundscan {

/**
 * @struct AcquiredAsset
 * @brief A file ready for decoding and the title to log it under.
 */
struct AcquiredAsset {
  std::string path;
  std::string title;
};

/**
 * @class AcquisitionCoordinator
 * @brief Applies one disposition, honoring sticky choices.
 */
class AcquisitionCoordinator {
  Fetcher &fetcher_;
  DecisionProvider &decisions_;
  AssetIndex &assets_;
  const LedgerSnapshot &ledger_;

  std::optional<AcquiredAsset> fetch(const Identifier &id,
                                     const std::string &reference,
                                     RunContext &ctx);
  std::string cached_title(const Identifier &id, const std::string &path) const;

public:
  AcquisitionCoordinator(Fetcher &fetcher, DecisionProvider &decisions,
                         AssetIndex &assets, const LedgerSnapshot &ledger);

  /**
   * @brief Obtain the asset for @p id.
   * @return The asset, or nullopt when the item is skipped
   * @throws FetchError in single-item mode when fetching fails
   */
  std::optional<AcquiredAsset> acquire(const Identifier &id,
                                       const std::string &reference,
                                       Disposition disposition,
                                       RunContext &ctx);
};

} // namespace soundscan

#endif // SOUNDSCAN_ACQUISITION_HPP
