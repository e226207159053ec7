#ifndef CIWAIT_CONFIG_HPP
#define CIWAIT_CONFIG_HPP

#include "hook.hpp"
#include "state_store.hpp"
#include "util/elapsed.hpp"

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace ciwait {

/**
 * Settings for a ci-wait session.
 *
 * Built once at startup from defaults, an optional YAML, TOML or JSON file,
 * the persisted `ci-wait.*` keys and command line overrides, then passed
 * around by const reference. Setters clamp out-of-range values.
 */
class Config {
public:
  static constexpr RunDuration kMinSlowPoll = 20;
  static constexpr RunDuration kMinFastPoll = 5;
  static constexpr int kMinFastPercent = 75;
  static constexpr int kMaxFastPercent = 100;
  static constexpr RunDuration kMinTimeout = 60;
  static constexpr int kMaxBarWidth = 200;
  static constexpr int kMaxHistorySize = 100;

  /// Delay before the first status query.
  RunDuration before_poll_seconds() const { return before_poll_seconds_; }
  void set_before_poll_seconds(RunDuration s) {
    before_poll_seconds_ = s < 0 ? 0 : s;
  }

  /// Sleep between queries while far from the expected finish.
  RunDuration slow_poll_seconds() const { return slow_poll_seconds_; }
  void set_slow_poll_seconds(RunDuration s) {
    slow_poll_seconds_ = s < kMinSlowPoll ? kMinSlowPoll : s;
  }

  /// Sleep between queries close to the expected finish.
  RunDuration fast_poll_seconds() const { return fast_poll_seconds_; }
  void set_fast_poll_seconds(RunDuration s) {
    fast_poll_seconds_ = s < kMinFastPoll ? kMinFastPoll : s;
  }

  /// Percentage of the median after which fast polling starts.
  int fast_poll_percent() const { return fast_poll_percent_; }
  void set_fast_poll_percent(int pct);

  /// Give up after this many seconds.
  RunDuration timeout_seconds() const { return timeout_seconds_; }
  void set_timeout_seconds(RunDuration s) {
    timeout_seconds_ = s < kMinTimeout ? kMinTimeout : s;
  }

  /// Stop as soon as any check fails.
  bool exit_early_on_fail() const { return exit_early_on_fail_; }
  void set_exit_early_on_fail(bool v) { exit_early_on_fail_ = v; }

  /// Progress bar cell count; 0 disables the bar.
  int progress_bar_width() const { return progress_bar_width_; }
  void set_progress_bar_width(int w);

  bool try_progress_bar() const { return try_progress_bar_; }
  void set_try_progress_bar(bool v) { try_progress_bar_ = v; }

  bool try_emit_bell() const { return try_emit_bell_; }
  void set_try_emit_bell(bool v) { try_emit_bell_ = v; }

  bool try_sound_player() const { return try_sound_player_; }
  void set_try_sound_player(bool v) { try_sound_player_ = v; }

  bool try_desktop_notify() const { return try_desktop_notify_; }
  void set_try_desktop_notify(bool v) { try_desktop_notify_ = v; }

  bool try_hooks() const { return try_hooks_; }
  void set_try_hooks(bool v) { try_hooks_ = v; }

  /// Number of past durations retained per category.
  int history_size() const { return history_size_; }
  void set_history_size(int n);

  /// Sound file played on success. Empty uses the platform default.
  const std::string &success_sound() const { return success_sound_; }
  void set_success_sound(const std::string &f) { success_sound_ = f; }

  /// Sound file played on failure. Empty uses the platform default.
  const std::string &failure_sound() const { return failure_sound_; }
  void set_failure_sound(const std::string &f) { failure_sound_ = f; }

  /// SQLite database for persisted state. Empty uses git config.
  const std::string &state_db() const { return state_db_; }
  void set_state_db(const std::string &path) { state_db_ = path; }

  bool verbose() const { return verbose_; }
  void set_verbose(bool v) { verbose_ = v; }

  const std::string &log_level() const { return log_level_; }
  void set_log_level(const std::string &level) { log_level_ = level; }

  const std::string &log_pattern() const { return log_pattern_; }
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Log file path. Empty disables file logging.
  const std::string &log_file() const { return log_file_; }
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to retain (0 disables rotation).
  int log_rotate() const { return log_rotate_; }
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Whether rotated log files are gzip compressed.
  bool log_compress() const { return log_compress_; }
  void set_log_compress(bool enable) { log_compress_ = enable; }

  /// Per-category log level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }
  void set_log_categories(
      const std::unordered_map<std::string, std::string> &categories) {
    log_categories_ = categories;
  }

  const HookSettings &hook_settings() const { return hooks_; }
  void set_hook_settings(const HookSettings &settings) { hooks_ = settings; }

  /**
   * Apply settings from a JSON object. Grouped sections (`polling`,
   * `progress`, `notifications`, `history`, `logging`) are flattened first and
   * keys may use either dashes or underscores.
   *
   * @throws nlohmann::json::exception When a value has the wrong type.
   * @throws std::runtime_error When a duration string is malformed.
   */
  void load_json(const nlohmann::json &j);

  /**
   * Overlay persisted `ci-wait.*` keys from @p store. Values that do not
   * parse are ignored with a warning.
   */
  void apply_overrides(const StateStore &store);

  /// Build a configuration from a JSON document.
  static Config from_json(const nlohmann::json &j);

  /**
   * Load configuration from a YAML, TOML or JSON file, chosen by extension.
   *
   * @throws std::runtime_error When the file is unreadable, malformed or of
   *         an unsupported type.
   */
  static Config from_file(const std::string &path);

private:
  RunDuration before_poll_seconds_ = 10;
  RunDuration slow_poll_seconds_ = 60;
  RunDuration fast_poll_seconds_ = 15;
  int fast_poll_percent_ = 90;
  RunDuration timeout_seconds_ = 7200;
  bool exit_early_on_fail_ = true;
  int progress_bar_width_ = 30;
  bool try_progress_bar_ = true;
  bool try_emit_bell_ = true;
  bool try_sound_player_ = true;
  bool try_desktop_notify_ = true;
  bool try_hooks_ = true;
  int history_size_ = 10;
  std::string success_sound_;
  std::string failure_sound_;
  std::string state_db_;
  bool verbose_ = false;
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  bool log_compress_ = false;
  std::unordered_map<std::string, std::string> log_categories_;
  HookSettings hooks_;
};

/**
 * Interpret a persisted boolean (`true`/`false`, `1`/`0`, `yes`/`no`,
 * `on`/`off`, case-insensitive).
 *
 * @return std::nullopt for anything else.
 */
std::optional<bool> parse_bool(const std::string &value);

} // namespace ciwait

#endif // CIWAIT_CONFIG_HPP
