/**
 * @file ytdlp_fetcher.cpp
 * @brief yt-dlp subprocess wrapper
 *
 * @details All three operations shell out to yt-dlp and read what it prints
 *          on stdout. The download template stamps the identifier into the
 *          file name so the asset index can find it on the next run.
 */

#include "soundscan/fetcher.hpp"

#include <filesystem>

#include <fmt/core.h>

#include "soundscan/errors.hpp"
#include "soundscan/logging.hpp"
#include "soundscan/system.hpp"

namespace soundscan {

YtDlpFetcher::YtDlpFetcher(std::string binary, std::string cookies)
    : binary_(std::move(binary)), cookies_(std::move(cookies)) {}

std::string YtDlpFetcher::base_command() const {
  std::string cmd = fmt::format("{} --quiet --no-warnings", binary_);
  if (!cookies_.empty()) {
    cmd += fmt::format(
        " --cookies {}",
        shell_quote(std::filesystem::absolute(cookies_).string()));
  }
  return cmd;
}

MediaMetadata YtDlpFetcher::resolve_metadata(const std::string &reference) {
  std::string cmd = fmt::format(
      "{} --skip-download --no-playlist --print {} {}", base_command(),
      shell_quote("%(id)s\t%(title)s"), shell_quote(reference));

  CommandResult res = run_command(cmd);
  if (res.exit_code != 0) {
    throw FetchError(reference,
                     fmt::format("yt-dlp metadata lookup failed with status {}",
                                 res.exit_code));
  }

  auto lines = split_lines(res.output);
  if (lines.empty()) {
    throw FetchError(reference, "yt-dlp returned no metadata");
  }

  /// First printed line belongs to the requested item
  const std::string &line = lines.front();
  size_t tab = line.find('\t');
  MediaMetadata meta;
  if (tab == std::string::npos) {
    meta.identifier = line;
  } else {
    meta.identifier = line.substr(0, tab);
    meta.title = line.substr(tab + 1);
  }
  if (meta.identifier.empty()) {
    throw FetchError(reference, "yt-dlp returned an empty identifier");
  }
  return meta;
}

std::string YtDlpFetcher::download(const std::string &reference,
                                   const std::string &directory) {
  std::string out_template =
      (std::filesystem::path(directory) / "%(title)s [%(id)s].%(ext)s")
          .string();

  std::string cmd = fmt::format(
      "{} --no-playlist -f {} -o {} --no-simulate --print after_move:filepath "
      "{}",
      base_command(), shell_quote("bestaudio[ext=m4a]/bestaudio"),
      shell_quote(out_template), shell_quote(reference));

  LOG_INFO("Downloading audio: {}", reference);
  CommandResult res = run_command(cmd);
  if (res.exit_code != 0) {
    throw FetchError(reference, fmt::format("yt-dlp download failed with "
                                            "status {}",
                                            res.exit_code));
  }

  auto lines = split_lines(res.output);
  if (lines.empty()) {
    throw FetchError(reference, "yt-dlp did not report a downloaded file");
  }

  std::string path = lines.back();
  if (!std::filesystem::exists(path)) {
    throw FetchError(reference,
                     fmt::format("downloaded file not found: {}", path));
  }
  return path;
}

std::vector<std::string> YtDlpFetcher::list_entries(const std::string &feed) {
  std::string cmd =
      fmt::format("{} --flat-playlist --print url {}", base_command(),
                  shell_quote(feed));

  CommandResult res = run_command(cmd);
  if (res.exit_code != 0) {
    throw FetchError(feed, fmt::format("yt-dlp listing failed with status {}",
                                       res.exit_code));
  }
  return split_lines(res.output);
}

} // namespace soundscan
