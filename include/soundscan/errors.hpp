/**
 * @file errors.hpp
 * @brief Exception types raised by the pipeline stages
 *
 * @details Each stage throws its own type so the pipeline can decide
 *          whether a failure ends the run, abandons one identifier, or
 *          goes to the retry list:
 *
 *          - ResolutionError: sources yielded nothing to process
 *
 *          - FetchError: metadata or download failed
 *
 *          - DecodeError: the codec produced no samples
 *
 *          - InferenceError: model load or a forward pass failed
 *
 *          - LedgerError: the ledger could not be read or appended
 */

#ifndef SOUNDSCAN_ERRORS_HPP
#define SOUNDSCAN_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace soundscan {

class ResolutionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @class FetchError
 * @brief Raised by a Fetcher; carries the reference that failed.
 */
class FetchError : public std::runtime_error {
  std::string reference_;

public:
  FetchError(std::string reference, const std::string &what)
      : std::runtime_error(what), reference_(std::move(reference)) {}

  const std::string &reference() const { return reference_; }
};

class DecodeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class InferenceError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class LedgerError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace soundscan

#endif // SOUNDSCAN_ERRORS_HPP
