#include "progress.hpp"

#include <algorithm>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace ciwait {

ProgressEstimator::ProgressEstimator(int width, bool enabled, std::string fill,
                                     std::string space)
    : width_(std::max(0, width)), enabled_(enabled), fill_(std::move(fill)),
      space_(std::move(space)) {}

std::optional<ProgressEstimate>
ProgressEstimator::estimate(RunDuration elapsed, RunDuration longest_elapsed,
                            RunDuration median, int pending) const {
  if (!enabled_ || width_ == 0 || median <= 0) {
    return std::nullopt;
  }
  RunDuration effective = std::max(elapsed, longest_elapsed);
  effective = std::clamp<RunDuration>(effective, 0, median);

  int percent = static_cast<int>(100 * effective / median);
  if (pending == 0) {
    percent = 100;
  } else if (percent >= 100) {
    percent = 99;
  }
  return ProgressEstimate{percent, render(percent)};
}

std::string ProgressEstimator::render(int percent) const {
  percent = std::clamp(percent, 0, 100);
  int filled = percent * width_ / 100;
  std::string bar = "[";
  for (int i = 0; i < width_; ++i) {
    bar += i < filled ? fill_ : space_;
  }
  bar += "] ";
  bar += fmt::format("{:>3}%", percent);
  return bar;
}

} // namespace ciwait
