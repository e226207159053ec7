#include "app.hpp"
#include "events.hpp"
#include "history.hpp"
#include "hook.hpp"
#include "log.hpp"
#include "notification.hpp"
#include "progress.hpp"
#include "state_store.hpp"
#include "status_provider.hpp"
#include "workspace.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace ciwait {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

std::unique_ptr<StateStore> open_state_store(const std::string &db_path,
                                             const ProcessRunner &capture) {
  if (!db_path.empty()) {
    return std::make_unique<SqliteStateStore>(db_path);
  }
  return std::make_unique<GitConfigStore>(capture);
}
} // namespace

void App::setup_logging() {
  std::string level_str = config_.log_level();
  if (options_.log_level_explicit) {
    level_str = options_.log_level;
  } else if (config_.verbose()) {
    level_str = "debug";
  }
  if (level_str == "warning") {
    level_str = "warn";
  }
  spdlog::level::level_enum lvl = spdlog::level::from_str(level_str);
  if (lvl == spdlog::level::off && level_str != "off") {
    lvl = spdlog::level::info;
  }
  if (options_.log_rotate_explicit) {
    config_.set_log_rotate(options_.log_rotate);
  }
  if (options_.log_compress) {
    config_.set_log_compress(true);
  }
  if (!options_.log_file.empty()) {
    config_.set_log_file(options_.log_file);
  }
  init_logger(lvl, config_.log_pattern(), config_.log_file(),
              static_cast<std::size_t>(config_.log_rotate()),
              config_.log_compress());

  auto categories = config_.log_categories();
  for (const auto &[name, level] : options_.log_categories) {
    categories[name] = level;
  }
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, category_level] : categories) {
    auto parsed = spdlog::level::from_str(category_level);
    if (parsed == spdlog::level::off && category_level != "off") {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      category_level, category);
      continue;
    }
    category_levels[category] = parsed;
  }
  configure_log_categories(category_levels);
  config_.set_log_categories(categories);
}

int App::test_notifications(EventSink &events) {
  std::ostream &out = services_.out ? *services_.out : std::cout;
  ProgressEstimator estimator(config_.progress_bar_width(),
                              config_.try_progress_bar());
  const RunDuration sample_median = 300;
  for (RunDuration elapsed : {0, 150, 300}) {
    if (auto est = estimator.estimate(elapsed, 0, sample_median,
                                      elapsed < sample_median ? 1 : 0)) {
      out << "selftest: " << format_elapsed(elapsed) << " " << est->bar
          << std::endl;
    }
  }
  const nlohmann::json data = {{"selftest", true}};
  events.post({EventKind::Increment, "selftest",
               "Notification test: a check passed", data});
  events.post({EventKind::Success, "selftest",
               "Notification test: all checks passed", data});
  events.post({EventKind::Failure, "selftest",
               "Notification test: a check failed", data});
  app_log()->info("Posted increment, success and failure test events");
  return 0;
}

/**
 * Execute one ci-wait command.
 *
 * Configuration is layered as defaults, then the configuration file, then
 * the persisted `ci-wait.*` keys, then command line flags.
 */
int App::run(int argc, char **argv) {
  outcome_.reset();
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    return exit.exit_code();
  }

  if (!options_.config_file.empty()) {
    try {
      config_ = Config::from_file(options_.config_file);
    } catch (const std::exception &e) {
      std::cerr << "ci-wait: invalid configuration " << options_.config_file
                << ": " << e.what() << std::endl;
      return 1;
    }
  }
  if (options_.verbose) {
    config_.set_verbose(true);
  }
  setup_logging();
  if (!options_.state_db.empty()) {
    config_.set_state_db(options_.state_db);
  }

  std::unique_ptr<StateStore> store;
  try {
    store = open_state_store(config_.state_db(), services_.capture);
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    return 1;
  }
  config_.apply_overrides(*store);
  if (options_.timeout_seconds) {
    config_.set_timeout_seconds(*options_.timeout_seconds);
  }
  if (options_.no_exit_early) {
    config_.set_exit_early_on_fail(false);
  }

  RollingHistoryStore history(*store,
                              static_cast<std::size_t>(config_.history_size()));
  if (options_.clear_history) {
    try {
      history.clear(Category::Success);
      history.clear(Category::Failure);
    } catch (const std::exception &e) {
      app_log()->error("Could not clear recorded CI durations: {}", e.what());
      return 1;
    }
    app_log()->info("Cleared recorded CI durations");
    return 0;
  }

  std::ostream &out = services_.out ? *services_.out : std::cout;
  DispatchChannels channels;
  channels.bell = config_.try_emit_bell();
  channels.sound = config_.try_sound_player();
  channels.desktop = config_.try_desktop_notify();
  channels.hooks = config_.try_hooks() && config_.hook_settings().has_actions();
  channels.success_sound = config_.success_sound().empty()
                               ? SoundPlayer::default_success_sound()
                               : config_.success_sound();
  channels.failure_sound = config_.failure_sound().empty()
                               ? SoundPlayer::default_failure_sound()
                               : config_.failure_sound();
  // Destroyed before returning, which flushes the pending notifications.
  EventDispatcher dispatcher(
      channels, std::make_shared<NotifySendNotifier>(services_.command),
      std::make_shared<SoundPlayer>(services_.command),
      std::make_shared<HookRunner>(config_.hook_settings()), out);

  if (options_.test_notifications) {
    return test_notifications(dispatcher);
  }

  std::string target;
  try {
    check_preconditions(services_.capture);
    target = resolve_target(options_.target, services_.capture);
  } catch (const PreconditionError &e) {
    app_log()->error("{}", e.what());
    return kPreconditionExitCode;
  }

  GhStatusProvider provider(services_.capture);
  CiPoller poller(config_, provider, history, dispatcher, services_.clock,
                  services_.sleeper, &out);
  outcome_ = poller.run(target);
  if (outcome_->exit_code < 0) {
    app_log()->warn("Last status query could not be run");
    return 1;
  }
  return outcome_->exit_code;
}

} // namespace ciwait
