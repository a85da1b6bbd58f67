/**
 * @file decision_provider.cpp
 * @brief Console and scripted decision providers
 */

#include "soundscan/decision_provider.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/core.h>

#include "soundscan/logging.hpp"

namespace soundscan {

namespace {

std::string normalize_answer(std::string s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) {
            return !std::isspace(c);
          }));
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char c) { return !std::isspace(c); })
              .base(),
          s.end());
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

/// "farts and burps" style list of logged class names
std::string describe_classes(const std::set<int> &classes) {
  std::string out;
  for (int code : classes) {
    if (!out.empty())
      out += " and ";
    out += event_class_name(code);
  }
  return out.empty() ? std::string("no classes") : out;
}

} // anonymous namespace

BatchPolicy parse_batch_policy(const std::string &answer) {
  std::string a = normalize_answer(answer);
  if (a == "y")
    return BatchPolicy::REDOWNLOAD_LOGGED_MISSING;
  if (a == "a")
    return BatchPolicy::PROCESS_ALL;
  if (a == "e")
    return BatchPolicy::EXIT;
  return BatchPolicy::SKIP_LOGGED_PROCESS_NEW;
}

// **---- Console ----**

ConsoleDecisionProvider::ConsoleDecisionProvider(std::istream &in,
                                                 std::ostream &out)
    : in_(in), out_(out) {}

std::string ConsoleDecisionProvider::ask(const std::string &prompt) {
  out_ << prompt << std::flush;
  std::string line;
  if (!std::getline(in_, line))
    return {};
  return normalize_answer(line);
}

bool ConsoleDecisionProvider::confirm_rerun_all(const BatchCounts &counts) {
  LOG_SUCCESS("All {} items are already processed and their files still "
              "exist.",
              counts.total);
  return ask("Do you want to re-run inference for all items? (Y/N): ") == "y";
}

BatchPolicy
ConsoleDecisionProvider::choose_batch_policy(const BatchCounts &counts) {
  LOG_WARN("There are inconsistencies between the ledger and existing files.");
  std::string answer = ask(fmt::format(
      "Would you like to:\n"
      "(Y) Re-download only missing files ({} logged items with missing "
      "files)\n"
      "(N) Skip logged items and process only new ones ({} items)\n"
      "(A) Process all items ({} items)\n"
      "(E) Exit\n"
      "Enter choice (Y/N/A/E): ",
      counts.logged_but_missing, counts.to_process, counts.total));

  if (answer != "y" && answer != "n" && answer != "a" && answer != "e")
    LOG_WARN("Invalid input. Defaulting to skipping logged items.");
  return parse_batch_policy(answer);
}

ReuseAnswer ConsoleDecisionProvider::confirm_reuse(const Identifier &id,
                                                   const std::string &path) {
  LOG_WARN("A file for {} already exists: {}", id, path);
  std::string answer = ask(
      "Do you want to use the existing file? (Y/N/A for Apply 'Y' to All): ");
  if (answer == "a")
    return ReuseAnswer::USE_FOR_ALL;
  if (answer == "n")
    return ReuseAnswer::REDOWNLOAD;
  return ReuseAnswer::USE_EXISTING;
}

ReinferAnswer
ConsoleDecisionProvider::confirm_reinfer(const Identifier &id,
                                         const std::set<int> &logged_classes,
                                         bool batch_mode) {
  LOG_WARN("{} has already been processed for {}.", id,
           describe_classes(logged_classes));
  std::string answer =
      batch_mode ? ask("Do you want to run inference again? (Y/N/A for "
                       "Apply 'N' to All): ")
                 : ask("Do you want to run inference again? (Y/N): ");
  if (answer == "a")
    return batch_mode ? ReinferAnswer::SKIP_ALL : ReinferAnswer::SKIP;
  if (answer == "n")
    return ReinferAnswer::SKIP;
  return ReinferAnswer::RERUN;
}

bool ConsoleDecisionProvider::confirm_retry(
    const std::vector<std::string> &failed) {
  return ask(fmt::format("Retry {} failed downloads? (Y/N): ",
                         failed.size())) == "y";
}

// **---- Scripted ----**

ScriptedDecisionProvider::Answers
ScriptedDecisionProvider::for_policy(BatchPolicy policy) {
  Answers a;
  a.policy = policy;
  a.rerun_all = (policy == BatchPolicy::PROCESS_ALL);
  a.reuse = ReuseAnswer::USE_FOR_ALL;
  a.reinfer = (policy == BatchPolicy::PROCESS_ALL) ? ReinferAnswer::RERUN
                                                   : ReinferAnswer::SKIP_ALL;
  a.retry = false;
  return a;
}

bool ScriptedDecisionProvider::confirm_rerun_all(const BatchCounts &) {
  ++calls_.rerun_all;
  return answers_.rerun_all;
}

BatchPolicy ScriptedDecisionProvider::choose_batch_policy(const BatchCounts &) {
  ++calls_.policy;
  return answers_.policy;
}

ReuseAnswer ScriptedDecisionProvider::confirm_reuse(const Identifier &,
                                                    const std::string &) {
  ++calls_.reuse;
  return answers_.reuse;
}

ReinferAnswer
ScriptedDecisionProvider::confirm_reinfer(const Identifier &,
                                          const std::set<int> &,
                                          bool batch_mode) {
  ++calls_.reinfer;
  if (answers_.reinfer == ReinferAnswer::SKIP_ALL && !batch_mode)
    return ReinferAnswer::SKIP;
  return answers_.reinfer;
}

bool ScriptedDecisionProvider::confirm_retry(const std::vector<std::string> &) {
  ++calls_.retry;
  return answers_.retry;
}

} // namespace soundscan
