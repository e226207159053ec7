/**
 * @file elapsed.hpp
 * @brief Conversions between second counts and human readable durations.
 *
 * Two dialects are handled here. The display form ("3m 05s") is what CI
 * providers print for check durations and what ci-wait prints back; its
 * parser is lenient and never throws. The option form ("90", "2h", "1h30m")
 * is what users type for timeouts and intervals; its parser is strict.
 */
#ifndef CIWAIT_UTIL_ELAPSED_HPP
#define CIWAIT_UTIL_ELAPSED_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace ciwait {

/// Count of whole seconds; never negative once produced by this module.
using RunDuration = std::int64_t;

/**
 * Format a second count as "<m>m <ss>s".
 *
 * Minutes are unbounded and seconds are zero-padded to two digits, so 3725
 * becomes "62m 05s". Negative values are formatted as zero.
 */
std::string format_elapsed(RunDuration seconds);

/**
 * Parse a display duration produced by format_elapsed() or by the provider.
 *
 * Accepts "<m>m <ss>s", "<m>m<ss>s" and "<ss>s" with optional surrounding
 * whitespace.
 *
 * @return Parsed seconds, or 0 for anything unrecognized.
 */
RunDuration parse_elapsed(const std::string &text);

/**
 * Parse an option duration such as "45", "10s", "5m", "2h" or "1h30m".
 *
 * A bare number is taken as seconds.
 *
 * @throws std::runtime_error on malformed input or an unknown unit.
 */
std::chrono::seconds parse_duration(const std::string &text);

} // namespace ciwait

#endif // CIWAIT_UTIL_ELAPSED_HPP
