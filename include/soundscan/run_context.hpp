/**
 * @file run_context.hpp
 * @brief Mutable state of one pipeline run
 *
 * @details Passed explicitly through every stage. Sticky choices are the only
 *          state carried from one identifier to the next.
 */

#ifndef SOUNDSCAN_RUN_CONTEXT_HPP
#define SOUNDSCAN_RUN_CONTEXT_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "types.hpp"

namespace soundscan {

/**
 * @struct RunCounters
 * @brief Tallies reported in the end-of-run summary.
 */
struct RunCounters {
  std::size_t total = 0;           //< Items looked at (remote and local)
  std::size_t inferenced = 0;      //< Items with every class pass complete
  std::size_t existing_used = 0;   //< Cached files used instead of fetching
  std::size_t new_downloads = 0;   //< Files fetched during this run
  std::size_t skipped = 0;         //< Skipped by disposition or user choice
  std::size_t fetch_failures = 0;  //< FetchError (batch mode: retry list)
  std::size_t decode_failures = 0; //< DecodeError or InferenceError
};

struct RunContext {
  bool batch_mode = false;
  bool full_rerun = false; //< PROCESS_ALL: suppress re-inference prompts
  StickyChoice sticky;
  RunCounters counters;
  std::vector<std::string> retry_list; //< References that failed to fetch
};

} // namespace soundscan

#endif // SOUNDSCAN_RUN_CONTEXT_HPP
