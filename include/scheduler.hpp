/**
 * @file scheduler.hpp
 * @brief Sleep interval selection between status queries.
 */
#ifndef CIWAIT_SCHEDULER_HPP
#define CIWAIT_SCHEDULER_HPP

#include "util/elapsed.hpp"

namespace ciwait {

/// Two-tier poll interval chooser.
struct PollScheduler {
  RunDuration fast_seconds{15};
  RunDuration slow_seconds{60};
  int fast_percent{90}; ///< Share of the median after which polling speeds up

  /**
   * Seconds to sleep before the next query.
   *
   * Polls fast once @p elapsed reaches fast_percent of a known @p median, or
   * while the provider has not reported any check yet; slow otherwise.
   */
  RunDuration next_sleep(RunDuration elapsed, RunDuration median,
                         int total_checks) const;
};

} // namespace ciwait

#endif // CIWAIT_SCHEDULER_HPP
