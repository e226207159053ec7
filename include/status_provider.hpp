#ifndef CIWAIT_STATUS_PROVIDER_HPP
#define CIWAIT_STATUS_PROVIDER_HPP

#include "util/process.hpp"

#include <string>

namespace ciwait {

/// Source of per-check CI status for a target.
class StatusProvider {
public:
  virtual ~StatusProvider() = default;

  /**
   * Query the current check set of @p target.
   *
   * @return Raw tab-separated rows and the query's exit status. Failures are
   *         reported through the exit status, never by throwing.
   */
  virtual ProcessResult query(const std::string &target) = 0;
};

/// Queries checks with `gh pr checks <target>`.
class GhStatusProvider : public StatusProvider {
public:
  explicit GhStatusProvider(ProcessRunner runner = run_captured);

  ProcessResult query(const std::string &target) override;

private:
  ProcessRunner run_;
};

} // namespace ciwait

#endif // CIWAIT_STATUS_PROVIDER_HPP
