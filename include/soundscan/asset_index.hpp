/**
 * @file asset_index.hpp
 * @brief Identifier -> cached audio file lookup
 *
 * @details A file belongs to an identifier when its name contains the
 *          identifier and ends in a recognized audio extension. Extensions
 *          are tried in AUDIO_EXTENSIONS order and, within one extension,
 *          file names in sorted order; the first match wins.
 */

#ifndef SOUNDSCAN_ASSET_INDEX_HPP
#define SOUNDSCAN_ASSET_INDEX_HPP

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace soundscan {

/**
 * @class AssetIndex
 * @brief Snapshot of which identifiers have a local asset.
 */
class AssetIndex {
  std::string dir_;
  std::vector<std::string> names_; //< Sorted regular file names in dir_
  std::unordered_map<Identifier, std::string> records_;

  std::optional<std::string> match(const Identifier &id) const;

public:
  explicit AssetIndex(std::string dir);

  /**
   * @brief Scan @p dir once and record a match for each identifier.
   * @note A missing directory yields an empty index.
   */
  static AssetIndex scan(const std::string &dir,
                         const std::vector<Identifier> &ids);

  std::optional<AssetRecord> lookup(const Identifier &id) const;
  bool contains(const Identifier &id) const { return records_.count(id) != 0; }

  /// Forget the record for @p id (file deleted or replaced)
  void invalidate(const Identifier &id);

  /// Record a newly written asset
  void record(const Identifier &id, const std::string &path);

  std::size_t size() const { return records_.size(); }
  const std::string &directory() const { return dir_; }
};

/**
 * @brief Title recovered from an asset file name.
 * @note "My Song [abc123].m4a" -> "My Song". Falls back to the file stem.
 */
std::string title_from_asset_name(const std::string &path,
                                  const Identifier &id);

} // namespace soundscan

#endif // SOUNDSCAN_ASSET_INDEX_HPP
