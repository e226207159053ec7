/**
 * @file snapshot.hpp
 * @brief Aggregate view of one CI status query.
 */
#ifndef CIWAIT_SNAPSHOT_HPP
#define CIWAIT_SNAPSHOT_HPP

#include "util/elapsed.hpp"

#include <string>

namespace ciwait {

/**
 * Counts of checks reported by one provider response.
 *
 * pending + failed + passed may be less than total when the provider reports
 * other states (skipped, cancelled, ...).
 */
struct CheckSetSnapshot {
  int total{0};
  int pending{0};
  int failed{0};
  int passed{0};
  RunDuration longest_elapsed{0}; ///< Slowest single check, in seconds
};

/**
 * Interpret tab-separated provider output.
 *
 * Each row is `<name>\t<status>\t<duration>[\t...]`. A status of exactly
 * "pending" counts as pending; one containing "fail" or "pass"
 * (case-insensitive) counts as failed or passed. Rows without a status column
 * are ignored. Empty or unrecognizable input yields an all-zero snapshot.
 */
CheckSetSnapshot parse_snapshot(const std::string &output);

/**
 * Compare two strings the way `sort -V` does: runs of digits are compared by
 * numeric value, everything else bytewise.
 *
 * @return Negative, zero or positive like strcmp.
 */
int version_compare(const std::string &a, const std::string &b);

} // namespace ciwait

#endif // CIWAIT_SNAPSHOT_HPP
