#include "config.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace ciwait {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::optional<long long> parse_integer(const std::string &s) {
  if (s.empty()) {
    return std::nullopt;
  }
  std::size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
  if (i == s.size()) {
    return std::nullopt;
  }
  for (std::size_t k = i; k < s.size(); ++k) {
    if (!std::isdigit(static_cast<unsigned char>(s[k]))) {
      return std::nullopt;
    }
  }
  try {
    return std::stoll(s);
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

/**
 * Convert a YAML node into a structurally equivalent JSON value. Scalars are
 * typed as booleans, integers or floating point numbers when they parse as
 * such and kept as strings otherwise.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    const std::string lower = to_lower_copy(s);
    if (lower == "true")
      return true;
    if (lower == "false")
      return false;
    if (auto i = parse_integer(s))
      return *i;
    std::istringstream iss(s);
    double d = 0.0;
    if (!s.empty() && (iss >> d) && iss.eof())
      return d;
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/// Translate a parsed TOML node to JSON.
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }
  if (const auto *array = node.as_array()) {
    json arr = json::array();
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }
  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();
  return nullptr;
}

/// Lift grouped sections to the root and spell every root key with '_'.
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json merged = source;
  for (std::string_view section :
       {"polling", "progress", "notifications", "history", "logging"}) {
    auto it = merged.find(std::string{section});
    if (it == merged.end() || !it->is_object()) {
      continue;
    }
    const nlohmann::json group = *it;
    for (const auto &[key, value] : group.items()) {
      merged[key] = value;
    }
  }
  nlohmann::json normalized = nlohmann::json::object();
  for (const auto &[key, value] : merged.items()) {
    std::string k = key;
    std::replace(k.begin(), k.end(), '-', '_');
    normalized[k] = value;
  }
  return normalized;
}

/// Seconds given either as a number or as a duration string such as "2h".
RunDuration seconds_value(const nlohmann::json &value) {
  if (value.is_string()) {
    return parse_duration(value.get<std::string>()).count();
  }
  return value.get<RunDuration>();
}

std::vector<std::pair<std::string, std::string>>
parse_hook_headers(const nlohmann::json &headers, std::string_view context) {
  std::vector<std::pair<std::string, std::string>> parsed;
  if (!headers.is_object()) {
    config_log()->warn("Hook headers for '{}' must be an object", context);
    return parsed;
  }
  for (const auto &[key, value] : headers.items()) {
    if (!value.is_string()) {
      config_log()->warn("Hook header '{}' for '{}' must be a string", key,
                         context);
      continue;
    }
    parsed.emplace_back(key, value.get<std::string>());
  }
  return parsed;
}

std::optional<HookAction> parse_hook_action(const nlohmann::json &value,
                                            std::string_view context) {
  if (value.is_string()) {
    HookAction action;
    action.command = value.get<std::string>();
    return action;
  }
  if (!value.is_object()) {
    config_log()->warn("Hook action for '{}' must be an object", context);
    return std::nullopt;
  }
  std::string type;
  if (value.contains("type") && value["type"].is_string()) {
    type = to_lower_copy(value["type"].get<std::string>());
  } else if (value.contains("command")) {
    type = "command";
  } else if (value.contains("endpoint")) {
    type = "http";
  } else {
    config_log()->warn("Hook action for '{}' has no command or endpoint",
                       context);
    return std::nullopt;
  }
  HookAction action;
  if (type == "command") {
    if (!value.contains("command") || !value["command"].is_string()) {
      config_log()->warn("Command hook for '{}' is missing 'command'", context);
      return std::nullopt;
    }
    action.command = value["command"].get<std::string>();
  } else if (type == "http") {
    if (!value.contains("endpoint") || !value["endpoint"].is_string()) {
      config_log()->warn("HTTP hook for '{}' is missing 'endpoint'", context);
      return std::nullopt;
    }
    action.type = HookActionType::Http;
    action.endpoint = value["endpoint"].get<std::string>();
    if (value.contains("method") && value["method"].is_string()) {
      action.method = value["method"].get<std::string>();
    }
    if (value.contains("headers")) {
      action.headers = parse_hook_headers(value["headers"], context);
    }
  } else {
    config_log()->warn("Unsupported hook type '{}' for '{}'", type, context);
    return std::nullopt;
  }
  return action;
}

void parse_hooks(const nlohmann::json &hooks, HookSettings &out) {
  if (!hooks.is_object()) {
    config_log()->warn("'hooks' must be an object");
    return;
  }
  if (hooks.contains("enabled")) {
    out.enabled = hooks["enabled"].get<bool>();
  }
  if (hooks.contains("command") || hooks.contains("endpoint")) {
    if (auto action = parse_hook_action(hooks, "default")) {
      out.default_actions.push_back(std::move(*action));
    }
  }
  auto actions_it = hooks.find("actions");
  if (actions_it != hooks.end() && actions_it->is_array()) {
    for (const auto &entry : *actions_it) {
      if (auto action = parse_hook_action(entry, "default")) {
        out.default_actions.push_back(std::move(*action));
      }
    }
  }
  auto events_it = hooks.find("events");
  if (events_it == hooks.end()) {
    return;
  }
  if (!events_it->is_object()) {
    config_log()->warn("'hooks.events' must be an object");
    return;
  }
  for (const auto &[event_name, entries] : events_it->items()) {
    std::vector<HookAction> parsed;
    if (entries.is_array()) {
      for (const auto &entry : entries) {
        if (auto action = parse_hook_action(entry, event_name)) {
          parsed.push_back(std::move(*action));
        }
      }
    } else if (auto action = parse_hook_action(entries, event_name)) {
      parsed.push_back(std::move(*action));
    }
    out.event_actions[event_name] = std::move(parsed);
  }
}

} // namespace

std::optional<bool> parse_bool(const std::string &value) {
  const std::string v = to_lower_copy(value);
  if (v == "true" || v == "1" || v == "yes" || v == "on") {
    return true;
  }
  if (v == "false" || v == "0" || v == "no" || v == "off") {
    return false;
  }
  return std::nullopt;
}

void Config::set_fast_poll_percent(int pct) {
  fast_poll_percent_ = std::clamp(pct, kMinFastPercent, kMaxFastPercent);
}

void Config::set_progress_bar_width(int w) {
  progress_bar_width_ = std::clamp(w, 0, kMaxBarWidth);
}

void Config::set_history_size(int n) {
  history_size_ = std::clamp(n, 0, kMaxHistorySize);
}

/**
 * Populate settings from a JSON object. Unknown keys are ignored.
 *
 * @param j JSON document holding configuration keys.
 */
void Config::load_json(const nlohmann::json &j) {
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("before_poll_seconds")) {
    set_before_poll_seconds(seconds_value(cfg["before_poll_seconds"]));
  }
  if (cfg.contains("slow_poll_seconds")) {
    set_slow_poll_seconds(seconds_value(cfg["slow_poll_seconds"]));
  }
  if (cfg.contains("fast_poll_seconds")) {
    set_fast_poll_seconds(seconds_value(cfg["fast_poll_seconds"]));
  }
  if (cfg.contains("fast_poll_percent")) {
    set_fast_poll_percent(cfg["fast_poll_percent"].get<int>());
  }
  if (cfg.contains("timeout_seconds")) {
    set_timeout_seconds(seconds_value(cfg["timeout_seconds"]));
  }
  if (cfg.contains("exit_early_on_fail")) {
    set_exit_early_on_fail(cfg["exit_early_on_fail"].get<bool>());
  }
  if (cfg.contains("progress_bar_width")) {
    set_progress_bar_width(cfg["progress_bar_width"].get<int>());
  }
  if (cfg.contains("try_progress_bar")) {
    set_try_progress_bar(cfg["try_progress_bar"].get<bool>());
  }
  if (cfg.contains("try_emit_bell")) {
    set_try_emit_bell(cfg["try_emit_bell"].get<bool>());
  }
  if (cfg.contains("try_sound_player")) {
    set_try_sound_player(cfg["try_sound_player"].get<bool>());
  }
  if (cfg.contains("try_desktop_notify")) {
    set_try_desktop_notify(cfg["try_desktop_notify"].get<bool>());
  }
  if (cfg.contains("try_hooks")) {
    set_try_hooks(cfg["try_hooks"].get<bool>());
  }
  if (cfg.contains("history_size")) {
    set_history_size(cfg["history_size"].get<int>());
  }
  if (cfg.contains("success_sound")) {
    set_success_sound(cfg["success_sound"].get<std::string>());
  }
  if (cfg.contains("failure_sound")) {
    set_failure_sound(cfg["failure_sound"].get<std::string>());
  }
  if (cfg.contains("state_db")) {
    set_state_db(cfg["state_db"].get<std::string>());
  }
  if (cfg.contains("verbose")) {
    set_verbose(cfg["verbose"].get<bool>());
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_compress")) {
    set_log_compress(cfg["log_compress"].get<bool>());
  }
  if (cfg.contains("log_categories")) {
    const auto &node = cfg["log_categories"];
    if (node.is_object()) {
      for (const auto &[name, level] : node.items()) {
        log_categories_[name] = level.get<std::string>();
      }
    } else {
      config_log()->warn("'log_categories' must map category names to levels");
    }
  }
  if (cfg.contains("hooks")) {
    parse_hooks(cfg["hooks"], hooks_);
  }
}

void Config::apply_overrides(const StateStore &store) {
  auto integer_key = [&](const std::string &key,
                         const std::function<void(long long)> &apply) {
    auto raw = store.get(key);
    if (!raw) {
      return;
    }
    if (auto value = parse_integer(*raw)) {
      config_log()->debug("Using ci-wait.{}={}", key, *value);
      apply(*value);
    } else {
      config_log()->warn("Ignoring ci-wait.{}: '{}' is not an integer", key,
                         *raw);
    }
  };
  auto boolean_key = [&](const std::string &key,
                         const std::function<void(bool)> &apply) {
    auto raw = store.get(key);
    if (!raw) {
      return;
    }
    if (auto value = parse_bool(*raw)) {
      config_log()->debug("Using ci-wait.{}={}", key, *value);
      apply(*value);
    } else {
      config_log()->warn("Ignoring ci-wait.{}: '{}' is not a boolean", key,
                         *raw);
    }
  };
  auto clamp_int = [](long long v) {
    return static_cast<int>(std::clamp<long long>(v, -1, 1000000));
  };

  integer_key("before-poll-seconds",
              [this](long long v) { set_before_poll_seconds(v); });
  integer_key("slow-poll-seconds",
              [this](long long v) { set_slow_poll_seconds(v); });
  integer_key("fast-poll-seconds",
              [this](long long v) { set_fast_poll_seconds(v); });
  integer_key("fast-poll-percent", [this, clamp_int](long long v) {
    set_fast_poll_percent(clamp_int(v));
  });
  integer_key("timeout-seconds",
              [this](long long v) { set_timeout_seconds(v); });
  boolean_key("exit-early-on-fail",
              [this](bool v) { set_exit_early_on_fail(v); });
  integer_key("progress-bar-width", [this, clamp_int](long long v) {
    set_progress_bar_width(clamp_int(v));
  });
  boolean_key("try-progress-bar", [this](bool v) { set_try_progress_bar(v); });
  boolean_key("try-emit-bell", [this](bool v) { set_try_emit_bell(v); });
  boolean_key("try-sound-player", [this](bool v) { set_try_sound_player(v); });
  boolean_key("try-desktop-notify",
              [this](bool v) { set_try_desktop_notify(v); });
  boolean_key("try-hooks", [this](bool v) { set_try_hooks(v); });
  integer_key("history-size", [this, clamp_int](long long v) {
    set_history_size(clamp_int(v));
  });

  for (const char *event : {"success", "failure"}) {
    const std::string key = std::string(event) + "-hook";
    auto command = store.get(key);
    if (!command || command->empty()) {
      continue;
    }
    HookAction action;
    action.command = *command;
    hooks_.event_actions[event] = {std::move(action)};
    config_log()->debug("Using ci-wait.{} for '{}' events", key, event);
  }
}

Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

Config Config::from_file(const std::string &path) {
  ensure_default_logger();
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension");
  }
  const std::string ext = to_lower_copy(path.substr(pos + 1));
  nlohmann::json j;
  try {
    if (ext == "yaml" || ext == "yml") {
      j = yaml_to_json(YAML::LoadFile(path));
    } else if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("Failed to open config file");
      }
      f >> j;
    } else if (ext == "toml" || ext == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      throw std::runtime_error("Unsupported config format: " + ext);
    }
    if (j.is_null()) {
      j = nlohmann::json::object();
    }
    if (!j.is_object()) {
      throw std::runtime_error("Config root must be a mapping");
    }
    Config cfg;
    cfg.load_json(j);
    config_log()->info("Config loaded from {}", path);
    return cfg;
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
}

} // namespace ciwait
