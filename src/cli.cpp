#include "cli.hpp"
#include "log.hpp"
#include "version.hpp"

#include <CLI/CLI.hpp>
#include <array>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace ciwait {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 13> categories = {
      "app",    "cli",      "config",  "events",   "history",
      "hooks",  "logging",  "notify",  "poller",   "process",
      "provider", "state", "workspace"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., poller=debug).";
  return oss.str();
}
} // namespace

CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"Wait for the CI checks of a pull request or branch to finish",
               "ci-wait"};
  app.footer(log_category_help_text());
  CliOptions options;
  std::string target;

  app.add_flag_function(
         "-V,--version",
         [](std::size_t) {
           std::cout << "ci-wait " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_flag("--clear-history", options.clear_history,
               "Forget the recorded CI durations and exit")
      ->group("General");
  app.add_flag("--test-notifications", options.test_notifications,
               "Exercise the progress bar, bell, sound, desktop and hook "
               "channels without querying CI")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file (YAML, TOML or JSON)")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("General");
  app.add_option("--state-db", options.state_db,
                 "Keep settings and history in this SQLite database instead "
                 "of git config")
      ->type_name("FILE")
      ->group("General");

  app.add_option_function<std::string>(
         "--timeout",
         [&options](const std::string &value) {
           try {
             options.timeout_seconds = parse_duration(value).count();
           } catch (const std::exception &e) {
             throw CLI::ValidationError("--timeout", e.what());
           }
         },
         "Give up after this long (e.g. 90m, 2h; plain numbers are seconds)")
      ->type_name("DURATION")
      ->group("Polling");
  app.add_flag("--no-exit-early", options.no_exit_early,
               "Keep polling after the first failed check")
      ->group("Polling");

  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("Logging");
  auto *level_opt =
      app.add_option(
             "-G,--log-level", options.log_level,
             "Set logging level (trace, debug, info, warn, error, critical, "
             "off)")
          ->type_name("LEVEL")
          ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning",
                                 "error", "critical", "off"}))
          ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to log file")
      ->type_name("FILE")
      ->group("Logging");
  auto *rotate_opt =
      app.add_option("--log-rotate", options.log_rotate,
                     "Number of rotated log files to keep (0 disables)")
          ->type_name("N")
          ->check(CLI::NonNegativeNumber)
          ->group("Logging");
  app.add_flag("--log-compress", options.log_compress,
               "Gzip rotated log files")
      ->group("Logging");
  app.add_option_function<std::vector<std::string>>(
         "--log-category",
         [&options](const std::vector<std::string> &values) {
           for (const auto &value : values) {
             auto pos = value.find('=');
             std::string name =
                 pos == std::string::npos ? value : value.substr(0, pos);
             std::string level = pos == std::string::npos
                                     ? std::string{"debug"}
                                     : value.substr(pos + 1);
             if (name.empty()) {
               throw CLI::ValidationError("--log-category",
                                          "category name must not be empty");
             }
             if (level.empty()) {
               level = "debug";
             }
             options.log_categories[name] = level;
           }
         },
         "Set the level of one logging category (NAME or NAME=LEVEL); may "
         "be repeated")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  auto *target_opt =
      app.add_option("target", target,
                     "Pull request number, URL or branch (defaults to the "
                     "current branch)")
          ->type_name("TARGET");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }

  options.log_level_explicit = level_opt->count() > 0U;
  options.log_rotate_explicit = rotate_opt->count() > 0U;
  if (options.verbose && !options.log_level_explicit) {
    options.log_level = "debug";
  }
  if (target_opt->count() > 0U) {
    options.target = target;
  }
  cli_log()->debug("Parsed command line: target={} config={}",
                   options.target ? *options.target : "<current branch>",
                   options.config_file.empty() ? "<none>"
                                               : options.config_file);
  return options;
}

} // namespace ciwait
