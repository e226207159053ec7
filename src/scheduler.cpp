#include "scheduler.hpp"

namespace ciwait {

RunDuration PollScheduler::next_sleep(RunDuration elapsed, RunDuration median,
                                      int total_checks) const {
  if (median > 0 && elapsed * 100 >= median * fast_percent) {
    return fast_seconds;
  }
  if (total_checks == 0) {
    return fast_seconds;
  }
  return slow_seconds;
}

} // namespace ciwait
