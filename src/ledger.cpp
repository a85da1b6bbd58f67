/**
 * @file ledger.cpp
 * @brief CSV ledger implementation
 *
 * @details Appends go through open(O_APPEND) + write + fsync + close so a
 *          crash after a class pass never loses the fact that it completed.
 */

#include "soundscan/ledger.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/core.h>

#include "soundscan/errors.hpp"
#include "soundscan/logging.hpp"
#include "soundscan/reference.hpp"

namespace soundscan {

// **---- CSV ----**

std::vector<std::string> parse_csv_line(const std::string &line) {
  std::vector<std::string> fields;
  std::string field;
  bool quoted = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          quoted = false;
        }
      } else {
        field += c;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(std::move(field));
      field.clear();
    } else if (c != '\r') {
      field += c;
    }
  }
  fields.push_back(std::move(field));
  return fields;
}

std::string csv_escape(const std::string &field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos)
    return field;

  std::string out = "\"";
  for (char c : field) {
    if (c == '"')
      out += "\"\"";
    else
      out += c;
  }
  out += '"';
  return out;
}

// **---- Snapshot ----**

LedgerSnapshot LedgerSnapshot::load(const std::string &path) {
  LedgerSnapshot snap;
  if (!std::filesystem::exists(path)) {
    LOG_INFO("Ledger {} not found. No previous processing detected.", path);
    return snap;
  }

  std::ifstream in(path);
  if (!in)
    throw LedgerError(fmt::format("Cannot read ledger {}", path));

  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty() || line == "\r")
      continue;

    auto fields = parse_csv_line(line);
    if (fields.size() < 2 || fields[0].empty()) {
      LOG_WARN("Ledger {}:{}: malformed row ignored", path, line_no);
      continue;
    }

    LedgerEntry entry;
    entry.reference = fields[0];
    entry.identifier = extract_identifier(fields[0]);
    try {
      entry.event_class = std::stoi(fields[1]);
    } catch (const std::exception &) {
      LOG_WARN("Ledger {}:{}: bad class code '{}' ignored", path, line_no,
               fields[1]);
      continue;
    }
    if (fields.size() > 2)
      entry.processed_at = fields[2];
    if (fields.size() > 3)
      entry.title = fields[3];
    snap.add(std::move(entry));
  }

  if (in.bad())
    throw LedgerError(fmt::format("I/O error while reading ledger {}", path));
  return snap;
}

void LedgerSnapshot::add(LedgerEntry entry) {
  Identifier id = entry.identifier;
  by_id_[id].push_back(std::move(entry));
  ++rows_;
}

bool LedgerSnapshot::is_logged(const Identifier &id, int event_class) const {
  auto it = by_id_.find(id);
  if (it == by_id_.end())
    return false;
  for (const auto &e : it->second) {
    if (e.event_class == event_class)
      return true;
  }
  return false;
}

bool LedgerSnapshot::logged_any(const Identifier &id) const {
  return by_id_.count(id) != 0;
}

std::set<int> LedgerSnapshot::logged_classes(const Identifier &id) const {
  std::set<int> out;
  auto it = by_id_.find(id);
  if (it != by_id_.end()) {
    for (const auto &e : it->second)
      out.insert(e.event_class);
  }
  return out;
}

std::string LedgerSnapshot::title_of(const Identifier &id) const {
  auto it = by_id_.find(id);
  if (it == by_id_.end())
    return {};
  for (auto e = it->second.rbegin(); e != it->second.rend(); ++e) {
    if (!e->title.empty())
      return e->title;
  }
  return {};
}

// **---- Writer ----**

LedgerWriter::LedgerWriter(std::string path) : path_(std::move(path)) {}

void LedgerWriter::append(const std::string &reference, int event_class,
                          const std::string &processed_at,
                          const std::string &title) {
  std::string row = fmt::format("{},{},{},{}\n", csv_escape(reference),
                                event_class, csv_escape(processed_at),
                                csv_escape(title));

  int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC,
                  0644);
  if (fd == -1) {
    throw LedgerError(
        fmt::format("Cannot open ledger {}: {}", path_, std::strerror(errno)));
  }

  size_t written = 0;
  while (written < row.size()) {
    ssize_t n = ::write(fd, row.data() + written, row.size() - written);
    if (n == -1) {
      if (errno == EINTR)
        continue;
      int err = errno;
      ::close(fd);
      throw LedgerError(fmt::format("Write to ledger {} failed: {}", path_,
                                    std::strerror(err)));
    }
    written += static_cast<size_t>(n);
  }

  if (::fsync(fd) == -1) {
    int err = errno;
    ::close(fd);
    throw LedgerError(
        fmt::format("fsync of ledger {} failed: {}", path_, std::strerror(err)));
  }

  if (::close(fd) == -1) {
    throw LedgerError(
        fmt::format("Closing ledger {} failed: {}", path_, std::strerror(errno)));
  }
}

} // namespace soundscan
