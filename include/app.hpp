/**
 * @file app.hpp
 * @brief Application entry point and orchestrator for ci-wait.
 *
 * Declares the App class, which parses the command line, layers the
 * configuration, wires the collaborators together and runs one command.
 */

#ifndef CIWAIT_APP_HPP
#define CIWAIT_APP_HPP

#include "cli.hpp"
#include "config.hpp"
#include "poller.hpp"
#include "util/process.hpp"

#include <optional>
#include <ostream>
#include <utility>

namespace ciwait {

/// Process exit status for unmet environment requirements.
constexpr int kPreconditionExitCode = 2;

/**
 * External effects used by App. Defaults reach the real shell, clock and
 * standard output; tests substitute scripted versions.
 */
struct AppServices {
  ProcessRunner capture = run_captured; ///< git and gh queries
  CommandRunner command = run_command;  ///< sound and desktop notifications
  CiPoller::Clock clock = std::chrono::steady_clock::now;
  CiPoller::Sleeper sleeper;            ///< Empty sleeps for real
  std::ostream *out = nullptr;          ///< Progress output; null is stdout
};

/**
 * Main application object. One instance runs one command: clear the
 * history, test the notification channels or wait for CI.
 */
class App {
public:
  App() = default;
  explicit App(AppServices services) : services_(std::move(services)) {}

  /**
   * Run the application with the given command line arguments.
   *
   * @return The exit status of the final CI status query when polling, zero
   *         for successful auxiliary commands, 2 for unmet preconditions and
   *         another non-zero value for usage or configuration errors.
   */
  int run(int argc, char **argv);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Fully layered configuration.
  const Config &config() const { return config_; }

  /// Outcome of the last polling session, if one ran.
  const std::optional<PollOutcome> &outcome() const { return outcome_; }

private:
  void setup_logging();
  int test_notifications(EventSink &events);

  AppServices services_;
  CliOptions options_;
  Config config_;
  std::optional<PollOutcome> outcome_;
};

} // namespace ciwait

#endif // CIWAIT_APP_HPP
