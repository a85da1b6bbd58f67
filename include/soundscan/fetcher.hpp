/**
 * @file fetcher.hpp
 * @brief Media fetcher interface and the yt-dlp backed implementation
 *
 * @details A Fetcher turns a remote reference into metadata, a local audio
 *          file, or (for feeds) a list of item references. Every failure is
 *          reported as FetchError carrying the reference.
 */

#ifndef SOUNDSCAN_FETCHER_HPP
#define SOUNDSCAN_FETCHER_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace soundscan {

/**
 * @struct MediaMetadata
 * @brief What the fetcher reports about a reference before downloading.
 */
struct MediaMetadata {
  Identifier identifier;
  std::string title;
};

/**
 * @class Fetcher
 * @brief Boundary to the network client.
 */
class Fetcher {
public:
  virtual ~Fetcher() = default;

  /// @throws FetchError
  virtual MediaMetadata resolve_metadata(const std::string &reference) = 0;

  /**
   * @brief Download the best audio stream into @p directory.
   * @return Path of the written file, stamped "<title> [<id>].<ext>"
   * @throws FetchError
   */
  virtual std::string download(const std::string &reference,
                               const std::string &directory) = 0;

  /**
   * @brief List the item references of a playlist, channel or account feed.
   * @throws FetchError
   */
  virtual std::vector<std::string> list_entries(const std::string &feed) = 0;
};

/**
 * @class YtDlpFetcher
 * @brief Fetcher that drives the yt-dlp executable as a subprocess.
 */
class YtDlpFetcher : public Fetcher {
  std::string binary_;
  std::string cookies_; //< Optional cookie file ("" = none)

  std::string base_command() const;

public:
  YtDlpFetcher(std::string binary, std::string cookies);

  MediaMetadata resolve_metadata(const std::string &reference) override;
  std::string download(const std::string &reference,
                       const std::string &directory) override;
  std::vector<std::string> list_entries(const std::string &feed) override;
};

} // namespace soundscan

#endif // SOUNDSCAN_FETCHER_HPP
