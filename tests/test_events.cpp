#include "events.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace ciwait;

namespace {

class RecordingNotifier : public Notifier {
public:
  void notify(const std::string &title, const std::string &message) override {
    if (message == "explode") {
      throw std::runtime_error("notifier crashed");
    }
    titles.push_back(title);
    messages.push_back(message);
  }
  std::vector<std::string> titles;
  std::vector<std::string> messages;
};

struct Harness {
  std::shared_ptr<RecordingNotifier> notifier =
      std::make_shared<RecordingNotifier>();
  std::vector<std::string> sound_cmds;
  std::vector<std::string> hook_events;
  std::vector<nlohmann::json> hook_payloads;
  std::ostringstream bell;

  std::shared_ptr<SoundPlayer> player() {
    return std::make_shared<SoundPlayer>([this](const std::string &cmd) {
      sound_cmds.push_back(cmd);
      return 0;
    });
  }

  std::shared_ptr<HookRunner> hooks() {
    HookSettings settings;
    HookAction action;
    action.command = "record";
    settings.default_actions.push_back(action);
    settings.event_actions["increment"] = {action};
    return std::make_shared<HookRunner>(
        settings, [this](const HookAction &, const HookEvent &event,
                         const std::string &payload) {
          hook_events.push_back(event.name);
          hook_payloads.push_back(nlohmann::json::parse(payload));
          return 0;
        });
  }
};

DispatchChannels all_channels() {
  DispatchChannels channels;
  channels.success_sound = "/sounds/ok.oga";
  channels.failure_sound = "/sounds/bad.oga";
  return channels;
}

} // namespace

TEST_CASE("dispatcher fans terminal events out to every channel") {
  Harness h;
  {
    EventDispatcher dispatcher(all_channels(), h.notifier, h.player(),
                               h.hooks(), h.bell);
    dispatcher.post({EventKind::Success, "feature", "All 3 checks passed",
                     {{"total", 3}}});
  }
  REQUIRE(h.bell.str() == "\a");
  REQUIRE(h.notifier->titles == std::vector<std::string>{"success"});
  REQUIRE(h.notifier->messages ==
          std::vector<std::string>{"All 3 checks passed"});
  REQUIRE_FALSE(h.sound_cmds.empty());
  REQUIRE(h.sound_cmds.back().find("'/sounds/ok.oga'") != std::string::npos);
  REQUIRE(h.hook_events == std::vector<std::string>{"success"});
  REQUIRE(h.hook_payloads[0]["data"]["target"] == "feature");
  REQUIRE(h.hook_payloads[0]["data"]["message"] == "All 3 checks passed");
  REQUIRE(h.hook_payloads[0]["data"]["total"] == 3);
}

TEST_CASE("dispatcher keeps increments to bell and hooks") {
  Harness h;
  {
    EventDispatcher dispatcher(all_channels(), h.notifier, h.player(),
                               h.hooks(), h.bell);
    dispatcher.post({EventKind::Increment, "feature", "2 of 3 checks passed"});
  }
  REQUIRE(h.bell.str() == "\a");
  REQUIRE(h.notifier->titles.empty());
  REQUIRE(h.sound_cmds.empty());
  REQUIRE(h.hook_events == std::vector<std::string>{"increment"});
}

TEST_CASE("dispatcher honours disabled channels") {
  Harness h;
  DispatchChannels channels = all_channels();
  channels.bell = false;
  channels.sound = false;
  channels.desktop = false;
  channels.hooks = false;
  {
    EventDispatcher dispatcher(channels, h.notifier, h.player(), h.hooks(),
                               h.bell);
    dispatcher.post({EventKind::Failure, "feature", "1 of 3 checks failed"});
  }
  REQUIRE(h.bell.str().empty());
  REQUIRE(h.notifier->titles.empty());
  REQUIRE(h.sound_cmds.empty());
  REQUIRE(h.hook_events.empty());
}

TEST_CASE("dispatcher survives failing channels and drains its queue") {
  Harness h;
  {
    EventDispatcher dispatcher(all_channels(), h.notifier, nullptr, nullptr,
                               h.bell);
    dispatcher.post({EventKind::Failure, "a", "explode"});
    for (int i = 0; i < 20; ++i) {
      dispatcher.post({EventKind::Failure, "b", "run " + std::to_string(i)});
    }
  }
  REQUIRE(h.notifier->messages.size() == 20);
  REQUIRE(h.notifier->messages.front() == "run 0");
  REQUIRE(h.notifier->messages.back() == "run 19");
  REQUIRE(h.bell.str() == std::string(21, '\a'));
}

namespace {

/// Blocks on its first notification until the test has seen it start.
class SlowNotifier : public Notifier {
public:
  void notify(const std::string &, const std::string &message) override {
    if (calls++ == 0) {
      started.set_value();
      std::this_thread::sleep_for(std::chrono::milliseconds(300));
    }
    messages.push_back(message);
  }
  std::promise<void> started;
  int calls = 0;
  std::vector<std::string> messages;
};

} // namespace

TEST_CASE("dispatcher drops queued events once the drain timeout passes") {
  auto notifier = std::make_shared<SlowNotifier>();
  auto started = notifier->started.get_future();
  std::ostringstream bell;
  DispatchChannels channels = all_channels();
  channels.bell = false;
  {
    EventDispatcher dispatcher(channels, notifier, nullptr, nullptr, bell,
                               std::chrono::milliseconds(20));
    dispatcher.post({EventKind::Success, "a", "first"});
    dispatcher.post({EventKind::Failure, "b", "second"});
    started.wait();
  }
  // The event in flight completes; the queued one is dropped.
  REQUIRE(notifier->messages == std::vector<std::string>{"first"});
}

TEST_CASE("event kinds map to hook names") {
  REQUIRE(to_string(EventKind::Increment) == "increment");
  REQUIRE(to_string(EventKind::Success) == "success");
  REQUIRE(to_string(EventKind::Failure) == "failure");
}
