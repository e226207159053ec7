#include "status_provider.hpp"
#include "log.hpp"

#include <utility>

namespace ciwait {

namespace {
std::shared_ptr<spdlog::logger> provider_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("provider");
  }();
  return logger;
}
} // namespace

GhStatusProvider::GhStatusProvider(ProcessRunner runner)
    : run_(std::move(runner)) {}

ProcessResult GhStatusProvider::query(const std::string &target) {
  // gh switches to tab-separated output when stdout is not a terminal.
  ProcessResult result =
      run_("gh pr checks " + shell_escape(target) + " 2>/dev/null");
  provider_log()->debug("gh pr checks {} exited with {} ({} bytes)", target,
                        result.exit_code, result.output.size());
  return result;
}

} // namespace ciwait
