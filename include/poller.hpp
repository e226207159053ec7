/**
 * @file poller.hpp
 * @brief Adaptive CI polling session.
 *
 * Defines CiPoller, the state machine that repeatedly queries a
 * StatusProvider for one target, prints progress, schedules the next query
 * from historical run durations and stops once the checks settle or the
 * session times out.
 */

#ifndef CIWAIT_POLLER_HPP
#define CIWAIT_POLLER_HPP

#include "config.hpp"
#include "events.hpp"
#include "history.hpp"
#include "progress.hpp"
#include "scheduler.hpp"
#include "snapshot.hpp"
#include "status_provider.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace ciwait {

/// Lifecycle of a polling session.
enum class PollState {
  AwaitingStart,              ///< No checks reported yet
  InProgress,                 ///< Checks reported, some still pending
  CompletedSuccess,           ///< Every check passed
  CompletedFailedOrIncomplete, ///< A check failed
  TimedOut                    ///< Gave up after the configured timeout
};

/// Display name of @p state, e.g. "COMPLETED_SUCCESS".
std::string to_string(PollState state);

/// Whether @p state ends a session.
bool is_terminal(PollState state);

/** \brief Result of a finished session. */
struct PollOutcome {
  PollState state{PollState::AwaitingStart};
  int iterations{0};
  CheckSetSnapshot last_snapshot;
  /// Median of the updated category, when history was written.
  std::optional<RunDuration> updated_median;
  /// Exit status of the final status query.
  int exit_code{0};
};

/**
 * Drives one polling session for a single target.
 *
 * All collaborators are borrowed and must outlive the poller. Time is read
 * through the injected clock and every wait goes through the sleeper, so a
 * session can run against a simulated clock.
 */
class CiPoller {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;
  using Sleeper = std::function<void(std::chrono::seconds)>;

  CiPoller(const Config &config, StatusProvider &provider,
           RollingHistoryStore &history, EventSink &events,
           Clock clock = std::chrono::steady_clock::now,
           Sleeper sleeper = Sleeper{}, std::ostream *out = nullptr);

  /**
   * Poll @p target until a terminal state is reached.
   *
   * Provider and history failures never abort the session.
   */
  PollOutcome run(const std::string &target);

  /**
   * Classify a snapshot taken @p elapsed seconds into the session.
   *
   * @return A terminal state, or AwaitingStart/InProgress to keep polling.
   */
  PollState classify(const CheckSetSnapshot &snapshot,
                     RunDuration elapsed) const;

private:
  void print_progress(const std::string &target,
                      const CheckSetSnapshot &snapshot, RunDuration elapsed,
                      RunDuration median, bool first);
  std::optional<RunDuration>
  record_history(Category category, std::optional<RunDuration> duration);
  void post_terminal(const std::string &target, const PollOutcome &outcome,
                     RunDuration elapsed);

  const Config &config_;
  StatusProvider &provider_;
  RollingHistoryStore &history_;
  EventSink &events_;
  Clock clock_;
  Sleeper sleeper_;
  std::ostream &out_;
  ProgressEstimator estimator_;
  PollScheduler scheduler_;
};

} // namespace ciwait

#endif // CIWAIT_POLLER_HPP
