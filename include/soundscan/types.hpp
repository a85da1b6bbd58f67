/**
 * @file types.hpp
 * @brief Core data types and constants for SoundScan
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Audio and model timing constants
 *
 *          - Event classes and the built-in class table
 *
 *          - Ledger and asset records
 *
 *          - Dispositions, batch policies and sticky choices
 *
 *          - ScoreMatrix and EventDetection for inference output
 */

#ifndef SOUNDSCAN_TYPES_HPP
#define SOUNDSCAN_TYPES_HPP

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace soundscan {

// **----- CONSTANTS -----**

/**
 * @brief Sample rate the decoder resamples every asset to.
 * @note The classifier was trained on 32 kHz mono input.
 */
constexpr int SAMPLE_RATE = 32000;

/// The classifier emits this many output frames per second of audio
constexpr int MODEL_FRAMES_PER_SECOND = 100;

/// Default frame length handed to the classifier (30 s at 32 kHz)
constexpr std::size_t DEFAULT_BATCH_SAMPLES = 960000;

/**
 * @brief Recognized audio extensions in lookup priority order.
 * @note The asset index walks extensions in this order, so an .opus file
 *       shadows an .m4a file of the same identifier.
 */
constexpr std::array<const char *, 5> AUDIO_EXTENSIONS = {
    ".opus", ".m4a", ".mp3", ".mp4", ".webm"};

/// Canonical identifier of one media item (video id, clip slug, ...)
using Identifier = std::string;

// **----- EVENT CLASSES -----**

/**
 * @struct EventClass
 * @brief A classifier output column, addressed by its model index.
 */
struct EventClass {
  int code;         //< Column index in the classifier output
  std::string name; //< Display name for headers and summaries
};

constexpr int FART_CLASS = 60;
constexpr int BURP_CLASS = 58;

/// Classes processed when no explicit class is selected, in run order
std::vector<EventClass> default_event_classes();

/// Look up the display name for a class code ("Class N" when unknown)
std::string event_class_name(int code);

// **----- LEDGER AND ASSETS -----**

/**
 * @struct LedgerEntry
 * @brief One durable processing fact.
 * @note Entries are append-only; an identifier may appear many times.
 */
struct LedgerEntry {
  std::string reference;    //< Reference as written to the ledger
  Identifier identifier;    //< Identifier derived from the reference
  int event_class = -1;     //< Class code that was processed
  std::string processed_at; //< "%d/%m/%Y_%H:%M:%S"
  std::string title;        //< Media title at processing time
};

/**
 * @struct AssetRecord
 * @brief A locally cached audio file for an identifier.
 */
struct AssetRecord {
  Identifier identifier;
  std::string local_path;
};

// **----- RECONCILIATION -----**

/**
 * @enum Disposition
 * @brief Per-identifier action decided by reconciliation.
 */
enum class Disposition {
  SKIP,
  REUSE_EXISTING,
  REDOWNLOAD_MISSING,
  DOWNLOAD_NEW,
  REINFER_EXISTING
};

/**
 * @enum BatchPolicy
 * @brief Batch-level answer to a ledger/cache inconsistency.
 */
enum class BatchPolicy {
  PROCESS_ALL,
  SKIP_LOGGED_PROCESS_NEW,
  REDOWNLOAD_LOGGED_MISSING,
  EXIT
};

const char *to_string(BatchPolicy p);

/**
 * @struct StickyChoice
 * @brief "Apply to all" answers that suppress later per-item prompts.
 */
struct StickyChoice {
  bool skip_all = false;         //< Skip every logged asset still present
  bool use_existing_all = false; //< Keep every unlogged cached asset
};

/**
 * @struct BatchCounts
 * @brief Ledger/cache overlap of a batch, computed before processing.
 */
struct BatchCounts {
  std::size_t total = 0;
  std::size_t logged = 0;
  std::size_t cached = 0;
  std::size_t logged_but_missing = 0;
  std::size_t cached_but_not_logged = 0;
  std::size_t to_process = 0; //< max(total - logged, 0)
};

// **----- INFERENCE OUTPUT -----**

/**
 * @struct EventDetection
 * @brief One pooled window that met the confidence threshold.
 */
struct EventDetection {
  double timestamp_seconds;
  int confidence_percent;
};

/**
 * @class ScoreMatrix
 * @brief Classifier output for one frame, row-major frames x classes.
 */
class ScoreMatrix {
  std::size_t frames_ = 0;
  std::size_t classes_ = 0;
  std::vector<float> data_;

public:
  ScoreMatrix() = default;
  ScoreMatrix(std::size_t frames, std::size_t classes, std::vector<float> data)
      : frames_(frames), classes_(classes), data_(std::move(data)) {
    if (data_.size() != frames_ * classes_)
      throw std::invalid_argument("score matrix size mismatch");
  }

  std::size_t frames() const { return frames_; }
  std::size_t classes() const { return classes_; }

  /**
   * @brief Copy out the per-frame series of one class.
   * @throws std::out_of_range if the class index is not in the matrix
   */
  std::vector<float> column(std::size_t cls) const;
};

} // namespace soundscan

#endif // SOUNDSCAN_TYPES_HPP
