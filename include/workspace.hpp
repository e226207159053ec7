/**
 * @file workspace.hpp
 * @brief Environment checks and CI target resolution.
 */

#ifndef CIWAIT_WORKSPACE_HPP
#define CIWAIT_WORKSPACE_HPP

#include "util/process.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace ciwait {

/// Raised when the environment cannot support a polling session.
class PreconditionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Extract the owner and repository from a GitHub remote URL.
 *
 * Accepts `git@github.com:owner/repo(.git)`, `ssh://` and `https://` forms.
 *
 * @return Owner/repository pair, or std::nullopt for non-GitHub URLs.
 */
std::optional<std::pair<std::string, std::string>>
parse_github_remote(const std::string &url);

/**
 * Verify that `git` and `gh` are installed, the working directory is inside a
 * git work tree and `gh` is authenticated.
 *
 * @throws PreconditionError Describing the first unmet requirement.
 */
void check_preconditions(const ProcessRunner &run = run_captured);

/**
 * Resolve the reference to poll.
 *
 * An explicit target is returned unchanged. Otherwise the current branch is
 * used, prefixed with `<origin-owner>:` when an `upstream` remote belongs to
 * a different GitHub owner than `origin`.
 *
 * @throws PreconditionError When HEAD is detached or no branch is found.
 */
std::string resolve_target(const std::optional<std::string> &explicit_target,
                           const ProcessRunner &run = run_captured);

} // namespace ciwait

#endif // CIWAIT_WORKSPACE_HPP
