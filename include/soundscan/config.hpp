/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Command-line flags (see options.hpp) cover per-run tuning; these
 *          cover where things live and which executables are used.
 */

#ifndef SOUNDSCAN_CONFIG_HPP
#define SOUNDSCAN_CONFIG_HPP

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>

#include "logging.hpp"

namespace soundscan {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or invalid
 * @param min_val Smallest accepted value
 * @return Parsed integer value or default
 * @note A value that is not a whole integer, or is below @p min_val, is
 *       reported and replaced by @p default_val.
 */
inline int get_env_int(const char *name, int default_val,
                       int min_val = std::numeric_limits<int>::min()) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;

  errno = 0;
  char *end = nullptr;
  long parsed = std::strtol(val, &end, 10);
  if (errno != 0 || *end != '\0' || parsed < min_val ||
      parsed > std::numeric_limits<int>::max()) {
    LOG_WARN("Ignoring {}='{}': expected an integer >= {}, using {}", name, val,
             min_val, default_val);
    return default_val;
  }
  return static_cast<int>(parsed);
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

// **---- FILES AND DIRECTORIES ----**

/// CSV ledger of processed (reference, class) facts
inline const std::string &ledger_path() {
  static std::string val = get_env_string("LEDGER_PATH", "inference_log.csv");
  return val;
}

/**
 * @brief Directory scanned for cached audio and used as download target.
 */
inline const std::string &asset_dir() {
  static std::string val = get_env_string("ASSET_DIR", ".");
  return val;
}

/// Where account feed listings are cached between runs
inline const std::string &feed_cache_dir() {
  static std::string val = get_env_string("FEED_CACHE_DIR", ".");
  return val;
}

/// References that failed to fetch, one per line
inline const std::string &retry_list_path() {
  static std::string val =
      get_env_string("RETRY_LIST_PATH", "failed_references.txt");
  return val;
}

// **---- EXTERNAL TOOLS ----**

inline const std::string &ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

inline const std::string &ytdlp_bin() {
  static std::string val = get_env_string("YTDLP_BIN", "yt-dlp");
  return val;
}

// **---- DECODING AND INFERENCE ----**

/**
 * @brief Samples read from the codec pipe per chunk.
 * @note Bounds decoder memory to one chunk buffer (2 bytes per sample).
 */
inline int decode_chunk_samples() {
  static int val = get_env_int("DECODE_CHUNK_SAMPLES", 960000, 1);
  return val;
}

/**
 * @brief Intra-op threads for ONNX Runtime.
 * @note 0 = use detect_cpu_limit().
 */
inline int inference_threads() {
  static int val = get_env_int("INFERENCE_THREADS", 0, 0);
  return val;
}

} // namespace Config
} // namespace soundscan

#endif // SOUNDSCAN_CONFIG_HPP
