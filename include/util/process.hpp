/**
 * @file process.hpp
 * @brief Shell command execution helpers.
 *
 * External collaborators (git, gh, sound players, notifiers, hooks) are all
 * reached through shell commands. Components take the runner as a
 * std::function so tests can substitute scripted results.
 */
#ifndef CIWAIT_UTIL_PROCESS_HPP
#define CIWAIT_UTIL_PROCESS_HPP

#include <functional>
#include <string>

namespace ciwait {

/// Outcome of a captured command.
struct ProcessResult {
  int exit_code{-1};  ///< Exit status, or -1 when the command did not run
  std::string output; ///< Captured standard output
};

/// Runs a shell command and captures its standard output.
using ProcessRunner = std::function<ProcessResult(const std::string &)>;

/// Runs a shell command for its side effect and returns its exit status.
using CommandRunner = std::function<int(const std::string &)>;

/**
 * Run @p command through `/bin/sh`, capturing stdout. Standard error is left
 * untouched; callers append `2>/dev/null` when they want it silenced.
 *
 * @return Exit status and output. A command that could not be started yields
 *         exit code -1 and empty output.
 */
ProcessResult run_captured(const std::string &command);

/// Run @p command through `std::system` and decode its exit status.
int run_command(const std::string &command);

/// Quote @p s for safe use as a single POSIX shell word.
std::string shell_escape(const std::string &s);

/// Whether @p tool resolves on PATH (`command -v`).
bool command_exists(const CommandRunner &run, const std::string &tool);

/// Remove trailing newline and carriage return characters.
std::string chomp(std::string s);

} // namespace ciwait

#endif // CIWAIT_UTIL_PROCESS_HPP
