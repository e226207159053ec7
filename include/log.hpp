/**
 * @file log.hpp
 * @brief Logging utilities for ci-wait.
 *
 * Declares logger initialization, category loggers, and per-category level
 * overrides. Console output goes to stderr so stdout stays reserved for the
 * progress lines printed by the poll loop.
 */

#ifndef CIWAIT_LOG_HPP
#define CIWAIT_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace ciwait {

/**
 * Initialize the global logger with a stderr sink and an optional file sink.
 *
 * @param level Logging verbosity level to use for all loggers.
 * @param pattern Log message pattern. Empty keeps the spdlog default.
 * @param file Optional log file path. When empty no file output is set up.
 * @param rotate_files Number of rotated files to keep when @p file is set.
 *        Zero writes a single, non-rotating file.
 * @param compress_rotations Gzip rotated files as they are rolled over.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3, bool compress_rotations = false);

/**
 * Retrieve or create the logger for a category.
 *
 * Category loggers share the sinks of the default logger and are registered as
 * `ciwait.<category>`.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/// Apply log level overrides keyed by category name.
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/**
 * Ensure a default logger exists before logging.
 *
 * Creates one at info level when init_logger() has not run yet.
 */
void ensure_default_logger();

} // namespace ciwait

#endif // CIWAIT_LOG_HPP
