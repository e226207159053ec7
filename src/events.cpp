#include "events.hpp"
#include "log.hpp"

#include <exception>
#include <utility>

namespace ciwait {

namespace {
std::shared_ptr<spdlog::logger> events_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("events");
  }();
  return logger;
}
} // namespace

std::string to_string(EventKind kind) {
  switch (kind) {
  case EventKind::Increment:
    return "increment";
  case EventKind::Success:
    return "success";
  case EventKind::Failure:
    return "failure";
  }
  return "unknown";
}

EventDispatcher::EventDispatcher(DispatchChannels channels,
                                 NotifierPtr notifier,
                                 std::shared_ptr<SoundPlayer> player,
                                 std::shared_ptr<HookRunner> hooks,
                                 std::ostream &bell_out,
                                 std::chrono::milliseconds drain_timeout)
    : channels_(std::move(channels)), notifier_(std::move(notifier)),
      player_(std::move(player)), hooks_(std::move(hooks)),
      bell_out_(bell_out), drain_timeout_(drain_timeout) {
  thread_ = std::thread([this] { worker(); });
}

EventDispatcher::~EventDispatcher() {
  {
    std::unique_lock<std::mutex> lk(mutex_);
    bool drained = idle_cv_.wait_for(lk, drain_timeout_, [this] {
      return queue_.empty() && !busy_;
    });
    if (!drained && !queue_.empty()) {
      events_log()->warn("Dropping {} undelivered notification(s)",
                         queue_.size());
      queue_.clear();
    }
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void EventDispatcher::post(NotifyEvent event) {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    queue_.push_back(std::move(event));
  }
  cv_.notify_one();
}

void EventDispatcher::worker() {
  while (true) {
    NotifyEvent event;
    {
      std::unique_lock<std::mutex> lk(mutex_);
      cv_.wait(lk, [this] { return stop_ || !queue_.empty(); });
      if (stop_ && queue_.empty()) {
        break;
      }
      event = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
    }
    try {
      dispatch(event);
    } catch (const std::exception &e) {
      events_log()->warn("Dispatching '{}' event failed: {}",
                         to_string(event.kind), e.what());
    }
    {
      std::lock_guard<std::mutex> lk(mutex_);
      busy_ = false;
    }
    idle_cv_.notify_all();
  }
}

void EventDispatcher::dispatch(const NotifyEvent &event) {
  const std::string name = to_string(event.kind);
  events_log()->debug("Dispatching '{}' for {}", name, event.target);
  const bool terminal = event.kind != EventKind::Increment;

  if (channels_.bell) {
    ring_bell(bell_out_);
  }
  if (terminal && channels_.sound && player_) {
    const std::string &file = event.kind == EventKind::Success
                                  ? channels_.success_sound
                                  : channels_.failure_sound;
    if (!player_->play(file)) {
      events_log()->debug("No sound played for '{}'", name);
    }
  }
  if (terminal && channels_.desktop && notifier_) {
    notifier_->notify(name, event.message);
  }
  if (channels_.hooks && hooks_) {
    HookEvent hook_event{name, event.data};
    hook_event.data["target"] = event.target;
    hook_event.data["message"] = event.message;
    hooks_->run(hook_event);
  }
}

} // namespace ciwait
