/**
 * @file cli.hpp
 * @brief Command line parsing for ci-wait.
 */

#ifndef CIWAIT_CLI_HPP
#define CIWAIT_CLI_HPP

#include "util/elapsed.hpp"

#include <exception>
#include <optional>
#include <string>
#include <unordered_map>

namespace ciwait {

/**
 * Signals that parsing requested an immediate exit (help, version, usage
 * errors). Carries the process exit code back to main().
 */
class CliParseExit : public std::exception {
public:
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Process exit code to return.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options. `*_explicit` flags record whether a value came
 * from the command line so it can take precedence over configuration files.
 */
struct CliOptions {
  bool verbose = false;
  std::string config_file;  ///< Optional YAML/TOML/JSON configuration
  std::string state_db;     ///< Optional SQLite state database
  std::string log_level = "info";
  bool log_level_explicit{false};
  std::string log_file;
  int log_rotate{3};
  bool log_rotate_explicit{false};
  bool log_compress{false};
  std::unordered_map<std::string, std::string> log_categories;
  bool clear_history{false};      ///< Clear stored durations and exit
  bool test_notifications{false}; ///< Exercise notification channels and exit
  std::optional<RunDuration> timeout_seconds;
  bool no_exit_early{false};
  std::optional<std::string> target; ///< Explicit PR, URL or branch
};

/**
 * Parse @p argv.
 *
 * @throws CliParseExit When help or version output was requested or the
 *         arguments are invalid; the exit code is zero only for the former.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace ciwait

#endif // CIWAIT_CLI_HPP
