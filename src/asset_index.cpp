/**
 * @file asset_index.cpp
 * @brief Asset directory scanning
 */

#include "soundscan/asset_index.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "soundscan/logging.hpp"

namespace soundscan {

namespace fs = std::filesystem;

AssetIndex::AssetIndex(std::string dir) : dir_(std::move(dir)) {}

AssetIndex AssetIndex::scan(const std::string &dir,
                            const std::vector<Identifier> &ids) {
  AssetIndex index(dir);

  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    LOG_WARN("Cannot scan asset directory {}: {}", dir, ec.message());
    return index;
  }

  for (const auto &entry : it) {
    std::error_code type_ec;
    if (entry.is_regular_file(type_ec))
      index.names_.push_back(entry.path().filename().string());
  }
  std::sort(index.names_.begin(), index.names_.end());

  for (const auto &id : ids) {
    if (auto path = index.match(id))
      index.records_[id] = *path;
  }
  return index;
}

std::optional<std::string> AssetIndex::match(const Identifier &id) const {
  if (id.empty())
    return std::nullopt;

  /// Extension is the outer loop: an .opus anywhere beats an .m4a
  for (const char *ext : AUDIO_EXTENSIONS) {
    std::string suffix(ext);
    for (const auto &name : names_) {
      if (name.size() < suffix.size())
        continue;
      if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) !=
          0)
        continue;
      if (name.find(id) != std::string::npos)
        return (fs::path(dir_) / name).string();
    }
  }
  return std::nullopt;
}

std::optional<AssetRecord> AssetIndex::lookup(const Identifier &id) const {
  auto it = records_.find(id);
  if (it == records_.end())
    return std::nullopt;
  return AssetRecord{id, it->second};
}

void AssetIndex::invalidate(const Identifier &id) { records_.erase(id); }

void AssetIndex::record(const Identifier &id, const std::string &path) {
  records_[id] = path;
}

std::string title_from_asset_name(const std::string &path,
                                  const Identifier &id) {
  std::string stem = fs::path(path).stem().string();
  std::string stamp = " [" + id + "]";
  size_t pos = stem.rfind(stamp);
  if (!id.empty() && pos != std::string::npos)
    return stem.substr(0, pos);
  return stem;
}

} // namespace soundscan
