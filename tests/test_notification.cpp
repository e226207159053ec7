#include "notification.hpp"
#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace ciwait;

TEST_CASE("NotifySendNotifier runs notify-send on Linux") {
#ifdef __linux__
  std::vector<std::string> cmds;
  NotifySendNotifier notifier([&](const std::string &cmd) {
    cmds.push_back(cmd);
    return 0;
  });
  notifier.notify("success", "All 4 checks passed");
  REQUIRE(cmds.size() == 2);
  CHECK(cmds[0] == "command -v 'notify-send' >/dev/null 2>&1");
  CHECK(cmds[1] == "notify-send 'ci-wait: success' 'All 4 checks passed'");
#endif
}

TEST_CASE("NotifySendNotifier skips missing tools on Linux") {
#ifdef __linux__
  std::vector<std::string> cmds;
  NotifySendNotifier notifier([&](const std::string &cmd) {
    cmds.push_back(cmd);
    return 1;
  });
  notifier.notify("failure", "it's broken");
  REQUIRE(cmds.size() == 1);
#endif
}

TEST_CASE("NotifySendNotifier prefers terminal-notifier on macOS") {
#ifdef __APPLE__
  std::vector<std::string> cmds;
  NotifySendNotifier notifier([&](const std::string &cmd) {
    cmds.push_back(cmd);
    return 0;
  });
  notifier.notify("success", "done");
  REQUIRE(cmds.size() == 2);
  CHECK(cmds[1] ==
        "terminal-notifier -title 'ci-wait: success' -message 'done'");
#endif
}

TEST_CASE("SoundPlayer uses the first available player") {
  std::vector<std::string> cmds;
  SoundPlayer player([&](const std::string &cmd) {
    cmds.push_back(cmd);
    if (cmd.find("command -v 'paplay'") == 0) {
      return 1;
    }
    return 0;
  });
  REQUIRE(player.play("/tmp/done.oga"));
  REQUIRE(cmds.size() == 3);
  CHECK(cmds[2] == "pw-play '/tmp/done.oga' >/dev/null 2>&1");
}

TEST_CASE("SoundPlayer without players or files") {
  int calls = 0;
  SoundPlayer player([&](const std::string &) {
    ++calls;
    return 127;
  });
  REQUIRE_FALSE(player.play(""));
  REQUIRE(calls == 0);
  REQUIRE_FALSE(player.play("/tmp/done.oga"));
  REQUIRE(calls == 3);
  REQUIRE_FALSE(SoundPlayer::default_success_sound().empty());
  REQUIRE(SoundPlayer::default_success_sound() !=
          SoundPlayer::default_failure_sound());
}

TEST_CASE("ring_bell writes BEL") {
  std::ostringstream out;
  ring_bell(out);
  REQUIRE(out.str() == "\a");
}
