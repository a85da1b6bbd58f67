/**
 * @file ledger.hpp
 * @brief Durable processing ledger (CSV) reader and writer
 *
 * @details The ledger is a CSV file with one row per completed
 *          (reference, event class) pass:
 *
 *              reference,class_code,%d/%m/%Y_%H:%M:%S,title
 *
 *          LedgerSnapshot loads it once before the processing loop and keys
 *          rows by Identifier, so every reference spelling of the same media
 *          counts as the same item. LedgerWriter appends rows during the run.
 *
 * @attention Appends made during a run do not change the snapshot. All
 *            dispositions are decided against the state at startup.
 */

#ifndef SOUNDSCAN_LEDGER_HPP
#define SOUNDSCAN_LEDGER_HPP

#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace soundscan {

// **---- CSV ----**

/**
 * @brief Split one CSV record, honoring "quoted, fields" and "" escapes.
 */
std::vector<std::string> parse_csv_line(const std::string &line);

/**
 * @brief Quote a field if it contains a comma, quote or newline.
 */
std::string csv_escape(const std::string &field);

// **---- SNAPSHOT ----**

/**
 * @class LedgerSnapshot
 * @brief Read-only view of the ledger as it was when loaded.
 */
class LedgerSnapshot {
  std::unordered_map<Identifier, std::vector<LedgerEntry>> by_id_;
  std::size_t rows_ = 0;

public:
  LedgerSnapshot() = default;

  /**
   * @brief Load a ledger file. A missing file is an empty ledger.
   * @throws LedgerError if the file exists but cannot be read
   */
  static LedgerSnapshot load(const std::string &path);

  /// Add an entry to the in-memory view
  void add(LedgerEntry entry);

  bool is_logged(const Identifier &id, int event_class) const;
  bool logged_any(const Identifier &id) const;

  /// Class codes logged for an identifier, ascending
  std::set<int> logged_classes(const Identifier &id) const;

  /// Title from the most recent entry ("" when not logged)
  std::string title_of(const Identifier &id) const;

  std::size_t size() const { return rows_; }
};

// **---- WRITER ----**

/**
 * @class LedgerWriter
 * @brief Appends ledger rows, one durable write per row.
 */
class LedgerWriter {
  std::string path_;

public:
  explicit LedgerWriter(std::string path);

  /**
   * @brief Append one row and fsync it before returning.
   * @throws LedgerError on any open, write, sync or close failure
   */
  void append(const std::string &reference, int event_class,
              const std::string &processed_at, const std::string &title);
};

} // namespace soundscan

#endif // SOUNDSCAN_LEDGER_HPP
