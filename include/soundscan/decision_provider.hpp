/**
 * @file decision_provider.hpp
 * @brief Every question the pipeline can ask, behind one interface
 *
 * @details The pipeline never reads a terminal. It asks a DecisionProvider:
 *
 *          - ConsoleDecisionProvider prompts on an output stream and reads
 *            one line per answer from an input stream
 *
 *          - ScriptedDecisionProvider returns fixed answers and counts how
 *            often each question was asked (non-interactive runs, tests)
 */

#ifndef SOUNDSCAN_DECISION_PROVIDER_HPP
#define SOUNDSCAN_DECISION_PROVIDER_HPP

#include <istream>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include "types.hpp"

namespace soundscan {

/// Answer to "an unlogged file for this item already exists"
enum class ReuseAnswer { USE_EXISTING, USE_FOR_ALL, REDOWNLOAD };

/// Answer to "this item was already processed"
enum class ReinferAnswer { RERUN, SKIP, SKIP_ALL };

/**
 * @class DecisionProvider
 * @brief Source of user decisions.
 */
class DecisionProvider {
public:
  virtual ~DecisionProvider() = default;

  /// Everything is logged and cached: re-run inference for all of it?
  virtual bool confirm_rerun_all(const BatchCounts &counts) = 0;

  /// Ledger and cache disagree: how should the batch proceed?
  virtual BatchPolicy choose_batch_policy(const BatchCounts &counts) = 0;

  virtual ReuseAnswer confirm_reuse(const Identifier &id,
                                    const std::string &asset_path) = 0;

  /**
   * @param logged_classes Classes already in the ledger for @p id
   * @param batch_mode SKIP_ALL is only offered in batch mode
   */
  virtual ReinferAnswer confirm_reinfer(const Identifier &id,
                                        const std::set<int> &logged_classes,
                                        bool batch_mode) = 0;

  /// Some references failed to fetch: run again with just those?
  virtual bool confirm_retry(const std::vector<std::string> &failed) = 0;
};

// **---- CONSOLE ----**

/**
 * @brief Map a one-letter batch policy answer.
 * @note Y = redownload logged-missing, N = skip logged, A = process all,
 *       E = exit. Anything else falls back to SKIP_LOGGED_PROCESS_NEW.
 */
BatchPolicy parse_batch_policy(const std::string &answer);

/**
 * @class ConsoleDecisionProvider
 * @brief Interactive prompts with single-letter answers.
 */
class ConsoleDecisionProvider : public DecisionProvider {
  std::istream &in_;
  std::ostream &out_;

  /// Print @p prompt and return the trimmed, lower-cased reply
  std::string ask(const std::string &prompt);

public:
  ConsoleDecisionProvider(std::istream &in, std::ostream &out);

  bool confirm_rerun_all(const BatchCounts &counts) override;
  BatchPolicy choose_batch_policy(const BatchCounts &counts) override;
  ReuseAnswer confirm_reuse(const Identifier &id,
                            const std::string &asset_path) override;
  ReinferAnswer confirm_reinfer(const Identifier &id,
                                const std::set<int> &logged_classes,
                                bool batch_mode) override;
  bool confirm_retry(const std::vector<std::string> &failed) override;
};

// **---- SCRIPTED ----**

/**
 * @class ScriptedDecisionProvider
 * @brief Fixed answers; records how many times each question came up.
 */
class ScriptedDecisionProvider : public DecisionProvider {
public:
  struct Answers {
    bool rerun_all = false;
    BatchPolicy policy = BatchPolicy::SKIP_LOGGED_PROCESS_NEW;
    ReuseAnswer reuse = ReuseAnswer::USE_EXISTING;
    ReinferAnswer reinfer = ReinferAnswer::SKIP;
    bool retry = false;
  };

  struct Calls {
    int rerun_all = 0;
    int policy = 0;
    int reuse = 0;
    int reinfer = 0;
    int retry = 0;

    int total() const { return rerun_all + policy + reuse + reinfer + retry; }
  };

  explicit ScriptedDecisionProvider(Answers answers) : answers_(answers) {}

  /**
   * @brief Answers that apply one batch policy to every question.
   * @note Used by --policy. PROCESS_ALL re-runs logged items and keeps
   *       cached files; every other policy skips re-inference.
   */
  static Answers for_policy(BatchPolicy policy);

  bool confirm_rerun_all(const BatchCounts &counts) override;
  BatchPolicy choose_batch_policy(const BatchCounts &counts) override;
  ReuseAnswer confirm_reuse(const Identifier &id,
                            const std::string &asset_path) override;
  ReinferAnswer confirm_reinfer(const Identifier &id,
                                const std::set<int> &logged_classes,
                                bool batch_mode) override;
  bool confirm_retry(const std::vector<std::string> &failed) override;

  const Calls &calls() const { return calls_; }
  Answers &answers() { return answers_; }

private:
  Answers answers_;
  Calls calls_;
};

} // namespace soundscan

#endif // SOUNDSCAN_DECISION_PROVIDER_HPP
