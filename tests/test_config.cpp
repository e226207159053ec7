#include "config.hpp"
#include "state_store.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace ciwait;

TEST_CASE("config defaults") {
  Config cfg;
  REQUIRE(cfg.before_poll_seconds() == 10);
  REQUIRE(cfg.slow_poll_seconds() == 60);
  REQUIRE(cfg.fast_poll_seconds() == 15);
  REQUIRE(cfg.fast_poll_percent() == 90);
  REQUIRE(cfg.timeout_seconds() == 7200);
  REQUIRE(cfg.exit_early_on_fail());
  REQUIRE(cfg.progress_bar_width() == 30);
  REQUIRE(cfg.try_progress_bar());
  REQUIRE(cfg.try_emit_bell());
  REQUIRE(cfg.try_sound_player());
  REQUIRE(cfg.try_desktop_notify());
  REQUIRE(cfg.try_hooks());
  REQUIRE(cfg.history_size() == 10);
  REQUIRE(cfg.state_db().empty());
  REQUIRE_FALSE(cfg.hook_settings().has_actions());
}

TEST_CASE("config setters clamp to safe bounds") {
  Config cfg;
  cfg.set_slow_poll_seconds(1);
  cfg.set_fast_poll_seconds(1);
  cfg.set_fast_poll_percent(10);
  cfg.set_timeout_seconds(5);
  cfg.set_before_poll_seconds(-3);
  cfg.set_progress_bar_width(500);
  cfg.set_history_size(-1);
  REQUIRE(cfg.slow_poll_seconds() == 20);
  REQUIRE(cfg.fast_poll_seconds() == 5);
  REQUIRE(cfg.fast_poll_percent() == 75);
  REQUIRE(cfg.timeout_seconds() == 60);
  REQUIRE(cfg.before_poll_seconds() == 0);
  REQUIRE(cfg.progress_bar_width() == 200);
  REQUIRE(cfg.history_size() == 0);

  cfg.set_fast_poll_percent(140);
  cfg.set_history_size(1000);
  REQUIRE(cfg.fast_poll_percent() == 100);
  REQUIRE(cfg.history_size() == 100);
}

TEST_CASE("config from grouped json") {
  nlohmann::json j;
  j["polling"] = {{"slow_poll_seconds", 45},
                  {"fast-poll-seconds", "10s"},
                  {"timeout_seconds", "1h"},
                  {"exit_early_on_fail", false}};
  j["progress"] = {{"progress_bar_width", 12}, {"try_progress_bar", false}};
  j["notifications"] = {{"try_emit_bell", false},
                        {"success_sound", "/tmp/ok.oga"}};
  j["history"] = {{"history_size", 4}};
  j["logging"] = {{"log_level", "debug"},
                  {"log_rotate", 5},
                  {"log_compress", true},
                  {"log_categories", {{"poller", "trace"}}}};
  j["state_db"] = "/tmp/ci-wait.db";

  Config cfg = Config::from_json(j);
  REQUIRE(cfg.slow_poll_seconds() == 45);
  REQUIRE(cfg.fast_poll_seconds() == 10);
  REQUIRE(cfg.timeout_seconds() == 3600);
  REQUIRE_FALSE(cfg.exit_early_on_fail());
  REQUIRE(cfg.progress_bar_width() == 12);
  REQUIRE_FALSE(cfg.try_progress_bar());
  REQUIRE_FALSE(cfg.try_emit_bell());
  REQUIRE(cfg.success_sound() == "/tmp/ok.oga");
  REQUIRE(cfg.history_size() == 4);
  REQUIRE(cfg.log_level() == "debug");
  REQUIRE(cfg.log_rotate() == 5);
  REQUIRE(cfg.log_compress());
  REQUIRE(cfg.log_categories().at("poller") == "trace");
  REQUIRE(cfg.state_db() == "/tmp/ci-wait.db");
}

TEST_CASE("config rejects mistyped values") {
  nlohmann::json j = {{"slow_poll_seconds", "soon"}};
  REQUIRE_THROWS_AS(Config::from_json(j), std::runtime_error);
  nlohmann::json k = {{"try_hooks", "maybe"}};
  REQUIRE_THROWS(Config::from_json(k));
}

TEST_CASE("config parses hook actions") {
  nlohmann::json j;
  j["hooks"] = {
      {"enabled", true},
      {"command", "echo done"},
      {"events",
       {{"increment", {"tput bel"}},
        {"failure",
         {{{"type", "http"},
           {"endpoint", "https://hooks.example/ci"},
           {"method", "PUT"},
           {"headers", {{"X-Token", "abc"}}}}}}}}};
  Config cfg = Config::from_json(j);
  const HookSettings &hooks = cfg.hook_settings();
  REQUIRE(hooks.enabled);
  REQUIRE(hooks.has_actions());
  REQUIRE(hooks.default_actions.size() == 1);
  REQUIRE(hooks.default_actions[0].command == "echo done");
  REQUIRE(hooks.event_actions.at("increment").size() == 1);
  REQUIRE(hooks.event_actions.at("increment")[0].command == "tput bel");
  const auto &failure = hooks.event_actions.at("failure");
  REQUIRE(failure.size() == 1);
  REQUIRE(failure[0].type == HookActionType::Http);
  REQUIRE(failure[0].endpoint == "https://hooks.example/ci");
  REQUIRE(failure[0].method == "PUT");
  REQUIRE(failure[0].headers.size() == 1);
  REQUIRE(failure[0].headers[0].first == "X-Token");
}

TEST_CASE("config applies persisted overrides") {
  SqliteStateStore store(":memory:");
  store.set("slow-poll-seconds", "30");
  store.set("fast-poll-seconds", "2");
  store.set("fast-poll-percent", "80");
  store.set("timeout-seconds", "900");
  store.set("before-poll-seconds", "0");
  store.set("exit-early-on-fail", "false");
  store.set("progress-bar-width", "20");
  store.set("try-progress-bar", "0");
  store.set("try-emit-bell", "no");
  store.set("try-sound-player", "OFF");
  store.set("try-desktop-notify", "yes");
  store.set("try-hooks", "1");
  store.set("history-size", "7");
  store.set("success-hook", "say passed");

  Config cfg;
  cfg.apply_overrides(store);
  REQUIRE(cfg.slow_poll_seconds() == 30);
  REQUIRE(cfg.fast_poll_seconds() == 5);
  REQUIRE(cfg.fast_poll_percent() == 80);
  REQUIRE(cfg.timeout_seconds() == 900);
  REQUIRE(cfg.before_poll_seconds() == 0);
  REQUIRE_FALSE(cfg.exit_early_on_fail());
  REQUIRE(cfg.progress_bar_width() == 20);
  REQUIRE_FALSE(cfg.try_progress_bar());
  REQUIRE_FALSE(cfg.try_emit_bell());
  REQUIRE_FALSE(cfg.try_sound_player());
  REQUIRE(cfg.try_desktop_notify());
  REQUIRE(cfg.try_hooks());
  REQUIRE(cfg.history_size() == 7);
  REQUIRE(cfg.hook_settings().event_actions.at("success")[0].command ==
          "say passed");
  REQUIRE(cfg.hook_settings().event_actions.count("failure") == 0);
}

TEST_CASE("config ignores unparseable persisted values") {
  SqliteStateStore store(":memory:");
  store.set("slow-poll-seconds", "fast");
  store.set("exit-early-on-fail", "sometimes");
  store.set("history-size", "12.5");
  Config cfg;
  cfg.apply_overrides(store);
  REQUIRE(cfg.slow_poll_seconds() == 60);
  REQUIRE(cfg.exit_early_on_fail());
  REQUIRE(cfg.history_size() == 10);
}

TEST_CASE("parse_bool aliases") {
  REQUIRE(parse_bool("true") == true);
  REQUIRE(parse_bool("1") == true);
  REQUIRE(parse_bool("On") == true);
  REQUIRE(parse_bool("FALSE") == false);
  REQUIRE(parse_bool("0") == false);
  REQUIRE(parse_bool("no") == false);
  REQUIRE_FALSE(parse_bool("2").has_value());
  REQUIRE_FALSE(parse_bool("").has_value());
}

TEST_CASE("config from yaml, toml and json files") {
  namespace fs = std::filesystem;
  const fs::path dir = fs::temp_directory_path();
  {
    std::ofstream f((dir / "ciwait_cfg.yaml").string());
    f << "polling:\n";
    f << "  slow_poll_seconds: 40\n";
    f << "  timeout_seconds: 30m\n";
    f << "notifications:\n";
    f << "  try_desktop_notify: false\n";
    f << "hooks:\n";
    f << "  command: notify-team\n";
  }
  Config ycfg = Config::from_file((dir / "ciwait_cfg.yaml").string());
  REQUIRE(ycfg.slow_poll_seconds() == 40);
  REQUIRE(ycfg.timeout_seconds() == 1800);
  REQUIRE_FALSE(ycfg.try_desktop_notify());
  REQUIRE(ycfg.hook_settings().default_actions.size() == 1);

  {
    std::ofstream f((dir / "ciwait_cfg.toml").string());
    f << "[polling]\n";
    f << "fast_poll_seconds = 8\n";
    f << "fast_poll_percent = 85\n";
    f << "[progress]\n";
    f << "progress_bar_width = 0\n";
  }
  Config tcfg = Config::from_file((dir / "ciwait_cfg.toml").string());
  REQUIRE(tcfg.fast_poll_seconds() == 8);
  REQUIRE(tcfg.fast_poll_percent() == 85);
  REQUIRE(tcfg.progress_bar_width() == 0);

  {
    std::ofstream f((dir / "ciwait_cfg.json").string());
    f << R"({"history": {"history_size": 3}, "try_hooks": false})";
  }
  Config jcfg = Config::from_file((dir / "ciwait_cfg.json").string());
  REQUIRE(jcfg.history_size() == 3);
  REQUIRE_FALSE(jcfg.try_hooks());

  fs::remove(dir / "ciwait_cfg.yaml");
  fs::remove(dir / "ciwait_cfg.toml");
  fs::remove(dir / "ciwait_cfg.json");
}

TEST_CASE("config file errors are reported") {
  namespace fs = std::filesystem;
  const fs::path dir = fs::temp_directory_path();
  REQUIRE_THROWS_AS(Config::from_file((dir / "ciwait_cfg.ini").string()),
                    std::runtime_error);
  REQUIRE_THROWS(Config::from_file((dir / "ciwait_missing.json").string()));
  {
    std::ofstream f((dir / "ciwait_bad.json").string());
    f << "{ not json";
  }
  REQUIRE_THROWS(Config::from_file((dir / "ciwait_bad.json").string()));
  fs::remove(dir / "ciwait_bad.json");
}
