#include "poller.hpp"
#include "log.hpp"

#include <exception>
#include <iostream>
#include <thread>
#include <utility>

namespace ciwait {

namespace {

std::shared_ptr<spdlog::logger> poller_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("poller");
  }();
  return logger;
}

std::string summarize(const CheckSetSnapshot &s) {
  if (s.total == 0) {
    return "waiting for checks to start";
  }
  return fmt::format("{}/{} passed, {} failed, {} pending", s.passed, s.total,
                     s.failed, s.pending);
}

} // namespace

std::string to_string(PollState state) {
  switch (state) {
  case PollState::AwaitingStart:
    return "AWAITING_START";
  case PollState::InProgress:
    return "IN_PROGRESS";
  case PollState::CompletedSuccess:
    return "COMPLETED_SUCCESS";
  case PollState::CompletedFailedOrIncomplete:
    return "COMPLETED_FAILED_OR_INCOMPLETE";
  case PollState::TimedOut:
    return "TIMED_OUT";
  }
  return "UNKNOWN";
}

bool is_terminal(PollState state) {
  return state == PollState::CompletedSuccess ||
         state == PollState::CompletedFailedOrIncomplete ||
         state == PollState::TimedOut;
}

CiPoller::CiPoller(const Config &config, StatusProvider &provider,
                   RollingHistoryStore &history, EventSink &events, Clock clock,
                   Sleeper sleeper, std::ostream *out)
    : config_(config), provider_(provider), history_(history), events_(events),
      clock_(std::move(clock)), sleeper_(std::move(sleeper)),
      out_(out ? *out : std::cout),
      estimator_(config.progress_bar_width(), config.try_progress_bar()) {
  if (!clock_) {
    clock_ = std::chrono::steady_clock::now;
  }
  if (!sleeper_) {
    sleeper_ = [](std::chrono::seconds s) { std::this_thread::sleep_for(s); };
  }
  scheduler_.fast_seconds = config.fast_poll_seconds();
  scheduler_.slow_seconds = config.slow_poll_seconds();
  scheduler_.fast_percent = config.fast_poll_percent();
}

PollState CiPoller::classify(const CheckSetSnapshot &snapshot,
                             RunDuration elapsed) const {
  const bool settled = snapshot.total > 0 && snapshot.pending == 0;
  if (settled && snapshot.failed == 0) {
    return PollState::CompletedSuccess;
  }
  if (snapshot.failed > 0 && (config_.exit_early_on_fail() || settled)) {
    return PollState::CompletedFailedOrIncomplete;
  }
  if (elapsed > config_.timeout_seconds()) {
    return PollState::TimedOut;
  }
  return snapshot.total == 0 ? PollState::AwaitingStart
                             : PollState::InProgress;
}

void CiPoller::print_progress(const std::string &target,
                              const CheckSetSnapshot &snapshot,
                              RunDuration elapsed, RunDuration median,
                              bool first) {
  std::string line = fmt::format("{}: {} [{}]", target, summarize(snapshot),
                                 format_elapsed(elapsed));
  // Nothing to estimate against when the run was already settled.
  if (!(first && snapshot.pending == 0)) {
    if (auto est = estimator_.estimate(elapsed, snapshot.longest_elapsed,
                                       median, snapshot.pending)) {
      line += " " + est->bar;
    }
  }
  out_ << line << std::endl;
}

std::optional<RunDuration>
CiPoller::record_history(Category category,
                         std::optional<RunDuration> duration) {
  try {
    return history_.update(category, duration, true);
  } catch (const std::exception &e) {
    poller_log()->warn("Could not update {} history: {}", to_string(category),
                       e.what());
  }
  return std::nullopt;
}

void CiPoller::post_terminal(const std::string &target,
                             const PollOutcome &outcome, RunDuration elapsed) {
  const CheckSetSnapshot &s = outcome.last_snapshot;
  NotifyEvent event;
  event.target = target;
  event.kind = outcome.state == PollState::CompletedSuccess
                   ? EventKind::Success
                   : EventKind::Failure;
  switch (outcome.state) {
  case PollState::CompletedSuccess:
    event.message = fmt::format("All {} checks passed for {} after {}",
                                s.total, target, format_elapsed(elapsed));
    break;
  case PollState::TimedOut:
    event.message = fmt::format("Gave up on {} after {} ({})", target,
                                format_elapsed(elapsed), summarize(s));
    break;
  default:
    event.message = fmt::format("{} of {} checks failed for {} after {}",
                                s.failed, s.total, target,
                                format_elapsed(elapsed));
    break;
  }
  event.data = {{"state", to_string(outcome.state)},
                {"total", s.total},
                {"passed", s.passed},
                {"failed", s.failed},
                {"pending", s.pending},
                {"elapsed_seconds", elapsed},
                {"longest_seconds", s.longest_elapsed},
                {"iterations", outcome.iterations}};
  if (outcome.updated_median) {
    event.data["median_seconds"] = *outcome.updated_median;
  }
  events_.post(std::move(event));
}

PollOutcome CiPoller::run(const std::string &target) {
  const auto start = clock_();
  auto elapsed_now = [&] {
    return static_cast<RunDuration>(
        std::chrono::duration_cast<std::chrono::seconds>(clock_() - start)
            .count());
  };

  RunDuration median = 0;
  try {
    median = history_.median(Category::Success);
  } catch (const std::exception &e) {
    poller_log()->warn("Could not read success history: {}", e.what());
  }
  poller_log()->info("Polling CI for {} (median {})", target,
                     median > 0 ? format_elapsed(median) : "unknown");

  if (config_.before_poll_seconds() > 0) {
    poller_log()->debug("Waiting {}s before the first query",
                        config_.before_poll_seconds());
    sleeper_(std::chrono::seconds(config_.before_poll_seconds()));
  }

  PollOutcome outcome;
  int last_passed = 0;
  RunDuration elapsed = 0;
  while (true) {
    ++outcome.iterations;
    ProcessResult res = provider_.query(target);
    outcome.exit_code = res.exit_code;
    if (res.output.empty() && res.exit_code != 0) {
      poller_log()->debug("Status query exited with {} and no output",
                          res.exit_code);
    }
    outcome.last_snapshot = parse_snapshot(res.output);
    elapsed = elapsed_now();
    const CheckSetSnapshot &snap = outcome.last_snapshot;

    print_progress(target, snap, elapsed, median, outcome.iterations == 1);

    if (outcome.iterations > 1 && snap.passed > last_passed) {
      NotifyEvent event;
      event.kind = EventKind::Increment;
      event.target = target;
      event.message = fmt::format("{} of {} checks passed", snap.passed,
                                  snap.total);
      event.data = {{"passed", snap.passed}, {"total", snap.total}};
      events_.post(std::move(event));
    }
    last_passed = snap.passed;

    outcome.state = classify(snap, elapsed);
    poller_log()->debug("Iteration {}: {} after {}s", outcome.iterations,
                        to_string(outcome.state), elapsed);
    if (is_terminal(outcome.state)) {
      break;
    }
    sleeper_(std::chrono::seconds(
        scheduler_.next_sleep(elapsed, median, snap.total)));
  }

  poller_log()->info("{} finished as {} after {} iteration(s)", target,
                     to_string(outcome.state), outcome.iterations);
  if (outcome.iterations > 1) {
    const Category category = outcome.state == PollState::CompletedSuccess
                                  ? Category::Success
                                  : Category::Failure;
    // A session that never saw a check has no duration to record.
    std::optional<RunDuration> duration;
    if (outcome.last_snapshot.total > 0) {
      duration = outcome.last_snapshot.longest_elapsed;
    }
    outcome.updated_median = record_history(category, duration);
    if (outcome.updated_median && *outcome.updated_median > 0 &&
        history_.capacity() > 0) {
      out_ << "Median " << to_string(category)
           << " duration: " << format_elapsed(*outcome.updated_median)
           << std::endl;
    }
    post_terminal(target, outcome, elapsed);
  }
  return outcome;
}

} // namespace ciwait
