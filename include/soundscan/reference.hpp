/**
 * @file reference.hpp
 * @brief Reference normalization and batch source resolution
 *
 * @details Turns whatever the user passed on the command line into an
 *          ordered, deduplicated list of canonical identifiers:
 *
 *          - single media URLs
 *
 *          - newline-delimited .txt list files
 *
 *          - playlists, channels and account feeds (listed via the Fetcher)
 *
 *          - local audio/video files, kept apart and never ledgered
 *
 * @note Two references for the same media (youtu.be short links, /shorts/
 *       paths, watch URLs with &list=, mobile hosts) map to the same
 *       Identifier.
 */

#ifndef SOUNDSCAN_REFERENCE_HPP
#define SOUNDSCAN_REFERENCE_HPP

#include <string>
#include <unordered_map>
#include <vector>

#include "fetcher.hpp"
#include "types.hpp"

namespace soundscan {

// **---- REFERENCE HELPERS ----**

/// True for http:// and https:// references
bool is_remote_reference(const std::string &ref);

/**
 * @brief Rewrite a reference to its canonical long form.
 * @note YouTube short forms become https://www.youtube.com/watch?v=ID.
 *       Other hosts are trimmed and lose their #fragment.
 */
std::string canonical_reference(const std::string &ref);

/**
 * @brief Stable key for a reference.
 * @return The extracted media id, or the trimmed reference itself when it is
 *         not a URL. Empty for YouTube URLs that name no single item
 *         (playlists, channels, watch?v= with no value).
 */
Identifier extract_identifier(const std::string &ref);

// **---- SOURCES ----**

enum class SourceKind { SINGLE, LIST_FILE, PLAYLIST, CHANNEL, ACCOUNT, LOCAL_FILE };

SourceKind classify_source(const std::string &raw);

/// True for every kind that expands into several items
inline bool is_collection(SourceKind kind) {
  return kind != SourceKind::SINGLE && kind != SourceKind::LOCAL_FILE;
}

/**
 * @struct ResolvedBatch
 * @brief Output of ReferenceResolver::resolve.
 */
struct ResolvedBatch {
  std::vector<Identifier> identifiers; //< First-occurrence order
  std::unordered_map<Identifier, std::string>
      references;                       //< Canonical reference per id
  std::vector<std::string> local_files; //< Local paths, in argument order
  bool batch_mode = false;

  const std::string &reference_of(const Identifier &id) const {
    return references.at(id);
  }
};

/**
 * @class ReferenceResolver
 * @brief Expands command-line sources into identifiers.
 */
class ReferenceResolver {
  Fetcher &fetcher_;
  std::string feed_cache_dir_;

  std::vector<std::string> read_list_file(const std::string &path) const;
  std::vector<std::string> list_feed(const std::string &feed);
  std::vector<std::string> list_account(const std::string &account_url);

public:
  ReferenceResolver(Fetcher &fetcher, std::string feed_cache_dir);

  /**
   * @brief Resolve all sources into one batch.
   * @throws ResolutionError when nothing processable was found
   */
  ResolvedBatch resolve(const std::vector<std::string> &sources);
};

} // namespace soundscan

#endif // SOUNDSCAN_REFERENCE_HPP
