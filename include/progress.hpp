/**
 * @file progress.hpp
 * @brief Progress percentage and bar rendering for a running CI session.
 */
#ifndef CIWAIT_PROGRESS_HPP
#define CIWAIT_PROGRESS_HPP

#include "util/elapsed.hpp"

#include <optional>
#include <string>

namespace ciwait {

/// Rendered progress estimate.
struct ProgressEstimate {
  int percent{0};  ///< 0-100; 100 only when nothing is pending
  std::string bar; ///< e.g. "[#####     ]  50%"
};

/**
 * Maps elapsed time against the historical median to a display percentage.
 *
 * The estimate is advisory only; it never feeds back into termination.
 */
class ProgressEstimator {
public:
  /**
   * @param width Number of bar cells. Zero disables rendering.
   * @param enabled Master switch (the `try-progress-bar` setting).
   */
  explicit ProgressEstimator(int width = 30, bool enabled = true,
                             std::string fill = "#", std::string space = " ");

  /**
   * Estimate progress.
   *
   * @param elapsed Wall time since the session started.
   * @param longest_elapsed Slowest check reported by the provider.
   * @param median Historical median run duration; 0 when unknown.
   * @param pending Number of checks still pending.
   * @return std::nullopt when there is no median or rendering is disabled.
   */
  std::optional<ProgressEstimate> estimate(RunDuration elapsed,
                                           RunDuration longest_elapsed,
                                           RunDuration median,
                                           int pending) const;

  /// Render a bar for an already computed percentage.
  std::string render(int percent) const;

private:
  int width_;
  bool enabled_;
  std::string fill_;
  std::string space_;
};

} // namespace ciwait

#endif // CIWAIT_PROGRESS_HPP
