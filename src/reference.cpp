/**
 * @file reference.cpp
 * @brief Reference normalization and batch source resolution
 */

#include "soundscan/reference.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

#include <fmt/core.h>

#include "soundscan/errors.hpp"
#include "soundscan/logging.hpp"

namespace soundscan {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

std::string trim(const std::string &s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
    ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
    --e;
  return s.substr(b, e - b);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * @struct ParsedUrl
 * @brief host/path/query split of an http(s) reference.
 * @note host is lower-cased with www., m. and music. removed.
 */
struct ParsedUrl {
  std::string host;
  std::vector<std::string> segments;
  std::string query;
};

bool parse_url(const std::string &ref, ParsedUrl &out) {
  size_t scheme = ref.find("://");
  if (scheme == std::string::npos)
    return false;

  std::string rest = ref.substr(scheme + 3);
  size_t hash = rest.find('#');
  if (hash != std::string::npos)
    rest.erase(hash);

  size_t q = rest.find('?');
  if (q != std::string::npos) {
    out.query = rest.substr(q + 1);
    rest.erase(q);
  }

  size_t slash = rest.find('/');
  std::string host = to_lower(rest.substr(0, slash));
  for (const char *prefix : {"www.", "m.", "music."}) {
    std::string p(prefix);
    if (host.compare(0, p.size(), p) == 0)
      host.erase(0, p.size());
  }
  out.host = host;

  if (slash != std::string::npos) {
    std::string path = rest.substr(slash + 1);
    size_t pos = 0;
    while (pos <= path.size()) {
      size_t end = path.find('/', pos);
      if (end == std::string::npos)
        end = path.size();
      if (end > pos)
        out.segments.push_back(path.substr(pos, end - pos));
      pos = end + 1;
    }
  }
  return true;
}

std::string query_param(const std::string &query, const std::string &key) {
  size_t pos = 0;
  while (pos < query.size()) {
    size_t end = query.find('&', pos);
    if (end == std::string::npos)
      end = query.size();
    std::string pair = query.substr(pos, end - pos);
    size_t eq = pair.find('=');
    if (eq != std::string::npos && pair.substr(0, eq) == key)
      return pair.substr(eq + 1);
    pos = end + 1;
  }
  return {};
}

bool is_youtube_host(const std::string &host) {
  return host == "youtu.be" || host == "youtube.com" ||
         ends_with(host, ".youtube.com");
}

/// Segment following @p marker, or "" when absent
std::string segment_after(const std::vector<std::string> &segs,
                          const std::string &marker) {
  for (size_t i = 0; i + 1 < segs.size(); ++i) {
    if (segs[i] == marker)
      return segs[i + 1];
  }
  return {};
}

std::string youtube_id(const ParsedUrl &url) {
  if (url.host == "youtu.be")
    return url.segments.empty() ? std::string() : url.segments.front();

  if (!url.segments.empty() && url.segments.front() == "watch")
    return query_param(url.query, "v");

  for (const char *marker : {"shorts", "live", "embed", "v"}) {
    std::string id = segment_after(url.segments, marker);
    if (!id.empty())
      return id;
  }
  return {};
}

/// Account name from "tiktok.com/@name..."
std::string account_name(const std::string &url) {
  size_t at = url.find("tiktok.com/@");
  if (at == std::string::npos)
    return "Unknown";
  size_t start = at + std::string("tiktok.com/@").size();
  size_t end = url.find_first_of("/?#", start);
  std::string name = url.substr(start, end == std::string::npos
                                           ? std::string::npos
                                           : end - start);
  return name.empty() ? "Unknown" : name;
}

} // anonymous namespace

// **---- Reference Helpers ----**

bool is_remote_reference(const std::string &ref) {
  std::string lower = to_lower(trim(ref));
  return lower.compare(0, 7, "http://") == 0 ||
         lower.compare(0, 8, "https://") == 0;
}

std::string canonical_reference(const std::string &ref) {
  std::string r = trim(ref);
  ParsedUrl url;
  if (!parse_url(r, url))
    return r;

  if (is_youtube_host(url.host)) {
    std::string id = youtube_id(url);
    if (!id.empty())
      return "https://www.youtube.com/watch?v=" + id;
  }

  size_t hash = r.find('#');
  if (hash != std::string::npos)
    r.erase(hash);
  return r;
}

Identifier extract_identifier(const std::string &ref) {
  std::string r = trim(ref);
  ParsedUrl url;
  if (!parse_url(r, url))
    return r;

  /// Playlists, channels and watch URLs without v= name no single item
  if (is_youtube_host(url.host))
    return youtube_id(url);

  if (url.host == "tiktok.com" || ends_with(url.host, ".tiktok.com")) {
    std::string id = segment_after(url.segments, "video");
    if (!id.empty())
      return id;
  }

  if (url.host == "clips.twitch.tv" && !url.segments.empty())
    return url.segments.front();

  if (url.host == "twitch.tv") {
    for (const char *marker : {"videos", "clip"}) {
      std::string id = segment_after(url.segments, marker);
      if (!id.empty())
        return id;
    }
  }

  /// Unknown host: last path segment is the best stable key
  if (!url.segments.empty())
    return url.segments.back();
  return r;
}

// **---- Sources ----**

SourceKind classify_source(const std::string &raw) {
  std::string src = trim(raw);
  if (!is_remote_reference(src)) {
    return ends_with(to_lower(src), ".txt") ? SourceKind::LIST_FILE
                                            : SourceKind::LOCAL_FILE;
  }

  std::string lower = to_lower(src);
  if (lower.find("youtube.com/playlist") != std::string::npos)
    return SourceKind::PLAYLIST;
  for (const char *marker : {"youtube.com/@", "youtube.com/c/",
                             "youtube.com/user/", "youtube.com/channel/"}) {
    if (lower.find(marker) != std::string::npos)
      return SourceKind::CHANNEL;
  }
  if (lower.find("tiktok.com/@") != std::string::npos &&
      lower.find("/video/") == std::string::npos)
    return SourceKind::ACCOUNT;
  return SourceKind::SINGLE;
}

ReferenceResolver::ReferenceResolver(Fetcher &fetcher,
                                     std::string feed_cache_dir)
    : fetcher_(fetcher), feed_cache_dir_(std::move(feed_cache_dir)) {}

std::vector<std::string>
ReferenceResolver::read_list_file(const std::string &path) const {
  std::ifstream in(path);
  if (!in)
    throw ResolutionError(fmt::format("Cannot open list file: {}", path));

  std::vector<std::string> refs;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string entry = trim(line);
    if (entry.empty() || entry[0] == '#')
      continue;
    if (!is_remote_reference(entry)) {
      LOG_WARN("{}:{}: not a media reference, ignored", path, line_no);
      continue;
    }
    refs.push_back(entry);
  }
  return refs;
}

std::vector<std::string> ReferenceResolver::list_feed(const std::string &feed) {
  LOG_INFO("Extracting item references from: {}", feed);
  try {
    auto refs = fetcher_.list_entries(feed);
    LOG_INFO("Extracted {} item references", refs.size());
    return refs;
  } catch (const FetchError &e) {
    LOG_ERROR("Failed to list {}: {}", feed, e.what());
    return {};
  }
}

std::vector<std::string>
ReferenceResolver::list_account(const std::string &account_url) {
  fs::path cache = fs::path(feed_cache_dir_) /
                   fmt::format("FeedURLs - @{}.txt", account_name(account_url));

  if (fs::exists(cache)) {
    LOG_INFO("Using cached feed listing: {}", cache.string());
    return read_list_file(cache.string());
  }

  auto refs = list_feed(account_url);
  if (refs.empty())
    return refs;

  std::ofstream out(cache);
  if (!out) {
    LOG_WARN("Could not write feed cache {}", cache.string());
    return refs;
  }
  for (const auto &r : refs)
    out << r << '\n';
  LOG_INFO("Feed listing saved to {}", cache.string());
  return refs;
}

ResolvedBatch
ReferenceResolver::resolve(const std::vector<std::string> &sources) {
  if (sources.empty())
    throw ResolutionError("No sources given");

  ResolvedBatch batch;
  batch.batch_mode = sources.size() > 1;

  auto add_reference = [&batch](const std::string &ref) {
    std::string canonical = canonical_reference(ref);
    Identifier id = extract_identifier(canonical);
    if (id.empty()) {
      LOG_WARN("No identifier in reference {}, ignored", ref);
      return;
    }
    if (batch.references.emplace(id, canonical).second)
      batch.identifiers.push_back(id);
  };

  for (const auto &raw : sources) {
    std::string src = trim(raw);
    SourceKind kind = classify_source(src);
    if (is_collection(kind))
      batch.batch_mode = true;

    switch (kind) {
    case SourceKind::LOCAL_FILE:
      if (!fs::is_regular_file(src)) {
        LOG_WARN("Local file not found: {}", src);
        break;
      }
      if (std::find(batch.local_files.begin(), batch.local_files.end(), src) ==
          batch.local_files.end())
        batch.local_files.push_back(src);
      break;
    case SourceKind::LIST_FILE:
      LOG_INFO("Reading list file: {}", src);
      for (const auto &ref : read_list_file(src)) {
        switch (classify_source(ref)) {
        case SourceKind::PLAYLIST:
        case SourceKind::CHANNEL:
          for (const auto &entry : list_feed(ref))
            add_reference(entry);
          break;
        case SourceKind::ACCOUNT:
          for (const auto &entry : list_account(ref))
            add_reference(entry);
          break;
        default:
          add_reference(ref);
          break;
        }
      }
      break;
    case SourceKind::PLAYLIST:
    case SourceKind::CHANNEL:
      for (const auto &ref : list_feed(src))
        add_reference(ref);
      break;
    case SourceKind::ACCOUNT:
      for (const auto &ref : list_account(src))
        add_reference(ref);
      break;
    case SourceKind::SINGLE:
      add_reference(src);
      break;
    }
  }

  if (batch.identifiers.empty() && batch.local_files.empty()) {
    throw ResolutionError("No media references found in the given sources");
  }
  return batch;
}

} // namespace soundscan
