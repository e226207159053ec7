/**
 * @file history.hpp
 * @brief Rolling per-outcome history of CI run durations.
 *
 * Declares the RollingHistoryStore, which keeps a bounded, oldest-first
 * sequence of past run durations for each outcome category and derives the
 * median estimate used for progress display and poll scheduling.
 */

#ifndef CIWAIT_HISTORY_HPP
#define CIWAIT_HISTORY_HPP

#include "state_store.hpp"
#include "util/elapsed.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <string>

namespace ciwait {

/// Outcome category used to partition duration statistics.
enum class Category { Success, Failure };

/// Lowercase name of @p category ("success" / "failure").
std::string to_string(Category category);

/// Oldest-first sequence of run durations.
using RollingHistory = std::deque<RunDuration>;

/**
 * Median estimate of @p history.
 *
 * Picks the value at ascending rank max(1, floor(n/2)) (1-indexed), which is
 * biased low for even and odd sizes alike. Scheduling thresholds are tuned
 * against this rank, so it must not be replaced with a true median.
 *
 * @return The selected value, or 0 for an empty history.
 */
RunDuration median_estimate(const RollingHistory &history);

/**
 * Bounded duration history persisted in a StateStore under
 * `rolling-elapsed-<category>` as whitespace-separated integers.
 */
class RollingHistoryStore {
public:
  /**
   * @param store Backing store; must outlive this object.
   * @param capacity Entries retained per category. Zero disables tracking.
   */
  RollingHistoryStore(StateStore &store, std::size_t capacity = 10);

  /// Retention cap per category.
  std::size_t capacity() const { return capacity_; }

  /**
   * Read the persisted history for @p category. Missing storage yields an
   * empty sequence; malformed entries are skipped.
   */
  RollingHistory fetch(Category category) const;

  /// Median estimate of the persisted history for @p category.
  RunDuration median(Category category) const;

  /**
   * Remove all persisted history for @p category.
   *
   * @throws std::runtime_error When the state store cannot remove the key.
   */
  void clear(Category category);

  /**
   * Append @p duration to the history for @p category, keeping at most
   * capacity() entries, and persist the result.
   *
   * An absent @p duration or a zero capacity leaves storage untouched.
   *
   * @param want_median Whether the updated median should be returned.
   * @return The median after the update when @p want_median is set (0 when
   *         tracking is disabled), otherwise std::nullopt.
   * @throws std::runtime_error When the backing store rejects the write.
   */
  std::optional<RunDuration> update(Category category,
                                    std::optional<RunDuration> duration,
                                    bool want_median);

private:
  static std::string key_for(Category category);

  StateStore &store_;
  std::size_t capacity_;
};

} // namespace ciwait

#endif // CIWAIT_HISTORY_HPP
