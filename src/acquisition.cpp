/**
 * @file acquisition.cpp
 * @brief Acquisition coordinator implementation
 */

#include "soundscan/acquisition.hpp"

#include <filesystem>
#include <system_error>

#include "soundscan/errors.hpp"
#include "soundscan/logging.hpp"

namespace soundscan {

namespace fs = std::filesystem;

AcquisitionCoordinator::AcquisitionCoordinator(Fetcher &fetcher,
                                               DecisionProvider &decisions,
                                               AssetIndex &assets,
                                               const LedgerSnapshot &ledger)
    : fetcher_(fetcher), decisions_(decisions), assets_(assets),
      ledger_(ledger) {}

std::string AcquisitionCoordinator::cached_title(const Identifier &id,
                                                 const std::string &path) const {
  std::string title = ledger_.title_of(id);
  return title.empty() ? title_from_asset_name(path, id) : title;
}

std::optional<AcquiredAsset>
AcquisitionCoordinator::fetch(const Identifier &id,
                              const std::string &reference, RunContext &ctx) {
  try {
    MediaMetadata meta = fetcher_.resolve_metadata(reference);
    std::string path = fetcher_.download(reference, assets_.directory());
    assets_.record(id, path);
    ++ctx.counters.new_downloads;
    LOG_SUCCESS("Audio downloaded: {}", path);

    std::string title =
        meta.title.empty() ? title_from_asset_name(path, id) : meta.title;
    return AcquiredAsset{path, title};
  } catch (const FetchError &e) {
    ++ctx.counters.fetch_failures;
    if (!ctx.batch_mode)
      throw;
    LOG_ERROR("Failed to fetch {}: {}", reference, e.what());
    ctx.retry_list.push_back(reference);
    return std::nullopt;
  }
}

std::optional<AcquiredAsset>
AcquisitionCoordinator::acquire(const Identifier &id,
                                const std::string &reference,
                                Disposition disposition, RunContext &ctx) {
  switch (disposition) {
  case Disposition::SKIP:
    ++ctx.counters.skipped;
    return std::nullopt;

  case Disposition::REDOWNLOAD_MISSING:
  case Disposition::DOWNLOAD_NEW:
    return fetch(id, reference, ctx);

  case Disposition::REINFER_EXISTING:
  case Disposition::REUSE_EXISTING:
    break;
  }

  auto record = assets_.lookup(id);
  if (!record || !fs::exists(record->local_path)) {
    if (record) {
      LOG_WARN("Cached file for {} vanished: {}", id, record->local_path);
      assets_.invalidate(id);
    }
    return fetch(id, reference, ctx);
  }
  const std::string path = record->local_path;

  if (disposition == Disposition::REINFER_EXISTING) {
    ++ctx.counters.existing_used;
    return AcquiredAsset{path, cached_title(id, path)};
  }

  // **---- Present but never processed ----**

  if (!ledger_.logged_any(id)) {
    if (ctx.sticky.use_existing_all) {
      LOG_INFO("Using existing file due to 'use for all' selection.");
    } else {
      switch (decisions_.confirm_reuse(id, path)) {
      case ReuseAnswer::USE_FOR_ALL:
        ctx.sticky.use_existing_all = true;
        LOG_INFO("Using existing files for all remaining items.");
        break;
      case ReuseAnswer::USE_EXISTING:
        LOG_INFO("Using existing file.");
        break;
      case ReuseAnswer::REDOWNLOAD: {
        LOG_INFO("Re-downloading audio for {}", id);
        std::error_code ec;
        fs::remove(path, ec);
        if (ec)
          LOG_WARN("Could not delete {}: {}", path, ec.message());
        assets_.invalidate(id);
        return fetch(id, reference, ctx);
      }
      }
    }
    ++ctx.counters.existing_used;
    return AcquiredAsset{path, cached_title(id, path)};
  }

  // **---- Present and already processed ----**

  if (ctx.sticky.skip_all) {
    LOG_INFO("Skipping {} due to 'skip all' selection.", id);
    ++ctx.counters.skipped;
    return std::nullopt;
  }

  if (ctx.full_rerun) {
    LOG_INFO("Skipping redundant warnings since batch re-run was selected.");
  } else {
    switch (decisions_.confirm_reinfer(id, ledger_.logged_classes(id),
                                       ctx.batch_mode)) {
    case ReinferAnswer::SKIP_ALL:
      ctx.sticky.skip_all = true;
      LOG_INFO("Skipping all remaining processed items in this batch.");
      ++ctx.counters.skipped;
      return std::nullopt;
    case ReinferAnswer::SKIP:
      LOG_INFO("Skipping {}.", id);
      ++ctx.counters.skipped;
      return std::nullopt;
    case ReinferAnswer::RERUN:
      break;
    }
  }

  ++ctx.counters.existing_used;
  return AcquiredAsset{path, cached_title(id, path)};
}

} // namespace soundscan
