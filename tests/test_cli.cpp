#include "cli.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace ciwait;

TEST_CASE("cli defaults", "[cli]") {
  char prog[] = "ci-wait";
  char *argv[] = {prog};
  CliOptions opts = parse_cli(1, argv);
  REQUIRE_FALSE(opts.verbose);
  REQUIRE_FALSE(opts.clear_history);
  REQUIRE_FALSE(opts.test_notifications);
  REQUIRE_FALSE(opts.no_exit_early);
  REQUIRE_FALSE(opts.target.has_value());
  REQUIRE_FALSE(opts.timeout_seconds.has_value());
  REQUIRE(opts.log_level == "info");
  REQUIRE_FALSE(opts.log_level_explicit);
  REQUIRE(opts.config_file.empty());
}

TEST_CASE("cli takes one optional target", "[cli]") {
  char prog[] = "ci-wait";
  char target[] = "123";
  char *argv1[] = {prog, target};
  CliOptions opts = parse_cli(2, argv1);
  REQUIRE(opts.target == "123");

  char other[] = "456";
  char *argv2[] = {prog, target, other};
  try {
    parse_cli(3, argv2);
    FAIL("expected a usage error");
  } catch (const CliParseExit &e) {
    REQUIRE(e.exit_code() != 0);
  }
}

TEST_CASE("cli commands and polling flags", "[cli]") {
  char prog[] = "ci-wait";
  char clear[] = "--clear-history";
  char test[] = "--test-notifications";
  char timeout[] = "--timeout";
  char ninety[] = "90m";
  char no_early[] = "--no-exit-early";
  char state_db[] = "--state-db";
  char db[] = "state.db";
  char *argv[] = {prog, clear, test, timeout, ninety, no_early, state_db, db};
  CliOptions opts = parse_cli(8, argv);
  REQUIRE(opts.clear_history);
  REQUIRE(opts.test_notifications);
  REQUIRE(opts.timeout_seconds == 5400);
  REQUIRE(opts.no_exit_early);
  REQUIRE(opts.state_db == "state.db");
}

TEST_CASE("cli rejects malformed timeouts", "[cli]") {
  char prog[] = "ci-wait";
  char timeout[] = "--timeout";
  char bad[] = "later";
  char *argv[] = {prog, timeout, bad};
  REQUIRE_THROWS_AS(parse_cli(3, argv), CliParseExit);
}

TEST_CASE("cli logging options", "[cli]") {
  char prog[] = "ci-wait";
  char verbose[] = "-v";
  char *argv1[] = {prog, verbose};
  CliOptions opts1 = parse_cli(2, argv1);
  REQUIRE(opts1.verbose);
  REQUIRE(opts1.log_level == "debug");

  char level[] = "-G";
  char warn[] = "warn";
  char *argv2[] = {prog, verbose, level, warn};
  CliOptions opts2 = parse_cli(4, argv2);
  REQUIRE(opts2.log_level == "warn");
  REQUIRE(opts2.log_level_explicit);

  char file[] = "-F";
  char path[] = "ci-wait.log";
  char rotate[] = "--log-rotate";
  char five[] = "5";
  char compress[] = "--log-compress";
  char category[] = "--log-category";
  char poller[] = "poller=trace";
  char category2[] = "--log-category";
  char hooks[] = "hooks";
  char *argv3[] = {prog,     file,   path,      rotate, five,
                   compress, category, poller, category2, hooks};
  CliOptions opts3 = parse_cli(10, argv3);
  REQUIRE(opts3.log_file == "ci-wait.log");
  REQUIRE(opts3.log_rotate == 5);
  REQUIRE(opts3.log_rotate_explicit);
  REQUIRE(opts3.log_compress);
  REQUIRE(opts3.log_categories.at("poller") == "trace");
  REQUIRE(opts3.log_categories.at("hooks") == "debug");

  char bogus[] = "loud";
  char *argv4[] = {prog, level, bogus};
  REQUIRE_THROWS_AS(parse_cli(3, argv4), CliParseExit);
}

TEST_CASE("cli help and version exit cleanly", "[cli]") {
  char prog[] = "ci-wait";
  char help[] = "--help";
  char *argv1[] = {prog, help};
  try {
    parse_cli(2, argv1);
    FAIL("expected help to exit");
  } catch (const CliParseExit &e) {
    REQUIRE(e.exit_code() == 0);
  }

  char version[] = "-V";
  char *argv2[] = {prog, version};
  try {
    parse_cli(2, argv2);
    FAIL("expected version to exit");
  } catch (const CliParseExit &e) {
    REQUIRE(e.exit_code() == 0);
  }
}

TEST_CASE("cli rejects missing config files", "[cli]") {
  char prog[] = "ci-wait";
  char config[] = "--config";
  char path[] = "/nonexistent/ci-wait.yaml";
  char *argv[] = {prog, config, path};
  REQUIRE_THROWS_AS(parse_cli(3, argv), CliParseExit);
}
