#include "workspace.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace ciwait {

namespace {

std::shared_ptr<spdlog::logger> workspace_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("workspace");
  }();
  return logger;
}

std::string trim(const std::string &s) {
  auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
               return std::isspace(c);
             }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::optional<std::string> remote_url(const ProcessRunner &run,
                                      const std::string &remote) {
  ProcessResult res =
      run("git remote get-url " + shell_escape(remote) + " 2>/dev/null");
  if (res.exit_code != 0) {
    return std::nullopt;
  }
  std::string url = trim(res.output);
  if (url.empty()) {
    return std::nullopt;
  }
  return url;
}

} // namespace

std::optional<std::pair<std::string, std::string>>
parse_github_remote(const std::string &url_in) {
  std::string url = trim(url_in);
  if (url.empty())
    return std::nullopt;

  auto pos = url.find("github.com");
  if (pos == std::string::npos)
    return std::nullopt;
  std::size_t start = pos + std::string_view("github.com").size();
  if (start >= url.size() || (url[start] != '/' && url[start] != ':'))
    return std::nullopt;
  std::string remainder = url.substr(start + 1);

  constexpr std::string_view git_suffix = ".git";
  if (remainder.size() > git_suffix.size() &&
      remainder.compare(remainder.size() - git_suffix.size(),
                        git_suffix.size(), git_suffix.data()) == 0) {
    remainder.erase(remainder.size() - git_suffix.size());
  }
  while (!remainder.empty() && remainder.back() == '/')
    remainder.pop_back();

  auto slash = remainder.find('/');
  if (slash == std::string::npos)
    return std::nullopt;
  std::string owner = remainder.substr(0, slash);
  std::string repo = remainder.substr(slash + 1);
  if (owner.empty() || repo.empty() || repo.find('/') != std::string::npos)
    return std::nullopt;
  return std::make_pair(owner, repo);
}

void check_preconditions(const ProcessRunner &run) {
  CommandRunner probe = [&run](const std::string &cmd) {
    return run(cmd).exit_code;
  };
  for (const char *tool : {"git", "gh"}) {
    if (!command_exists(probe, tool)) {
      throw PreconditionError(std::string("Required tool '") + tool +
                              "' was not found on PATH");
    }
  }
  ProcessResult inside =
      run("git rev-parse --is-inside-work-tree 2>/dev/null");
  if (inside.exit_code != 0 || trim(inside.output) != "true") {
    throw PreconditionError("Not inside a git work tree");
  }
  if (run("gh auth status >/dev/null 2>&1").exit_code != 0) {
    throw PreconditionError(
        "gh is not authenticated; run 'gh auth login' first");
  }
  workspace_log()->debug("Environment checks passed");
}

std::string resolve_target(const std::optional<std::string> &explicit_target,
                           const ProcessRunner &run) {
  if (explicit_target && !explicit_target->empty()) {
    return *explicit_target;
  }
  ProcessResult head = run("git symbolic-ref --quiet --short HEAD 2>/dev/null");
  std::string branch = trim(head.output);
  if (head.exit_code != 0 || branch.empty()) {
    throw PreconditionError(
        "Could not determine the current branch (detached HEAD?); pass a "
        "target explicitly");
  }

  auto upstream = remote_url(run, "upstream");
  auto origin = remote_url(run, "origin");
  if (upstream && origin) {
    auto upstream_repo = parse_github_remote(*upstream);
    auto origin_repo = parse_github_remote(*origin);
    if (upstream_repo && origin_repo &&
        upstream_repo->first != origin_repo->first) {
      workspace_log()->debug("Fork of {}/{} detected, qualifying branch",
                             upstream_repo->first, upstream_repo->second);
      return origin_repo->first + ":" + branch;
    }
  }
  return branch;
}

} // namespace ciwait
