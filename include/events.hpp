/**
 * @file events.hpp
 * @brief Fire-and-forget delivery of session events to notification channels.
 *
 * The poll loop only ever talks to an EventSink. The production sink is the
 * EventDispatcher, which performs bell, sound, desktop and hook side effects
 * on a dedicated worker thread and discards their outcome.
 */

#ifndef CIWAIT_EVENTS_HPP
#define CIWAIT_EVENTS_HPP

#include "hook.hpp"
#include "notification.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <thread>

namespace ciwait {

/// Kinds of events emitted by a polling session.
enum class EventKind {
  Increment, ///< Another check passed
  Success,   ///< Session finished with every check passing
  Failure    ///< Session finished with failures, incomplete, or timed out
};

/// Event name as seen by hooks ("increment", "success", "failure").
std::string to_string(EventKind kind);

/** \brief Notification intent posted by the poll loop. */
struct NotifyEvent {
  EventKind kind{EventKind::Increment};
  std::string target;  ///< CI target the session tracked
  std::string message; ///< Human readable one-line summary
  nlohmann::json data = nlohmann::json::object(); ///< Extra hook payload
};

/// Destination for notification intents. post() must not block.
class EventSink {
public:
  virtual ~EventSink() = default;
  virtual void post(NotifyEvent event) = 0;
};

/** \brief Which channels the dispatcher drives. */
struct DispatchChannels {
  bool bell{true};
  bool sound{true};
  bool desktop{true};
  bool hooks{true};
  std::string success_sound;
  std::string failure_sound;
};

/**
 * @brief Asynchronous EventSink that runs side effects on a worker thread.
 *
 * Failures inside a channel are logged and swallowed. The destructor waits up
 * to the drain timeout for queued events to be delivered, then drops whatever
 * is still queued. An event already being delivered always runs to
 * completion, so a hook command that never exits still delays shutdown.
 */
class EventDispatcher : public EventSink {
public:
  static constexpr std::chrono::milliseconds kDefaultDrainTimeout{30000};

  /**
   * @param channels Enabled channels and sound files.
   * @param notifier Desktop notifier; may be null to disable that channel.
   * @param player Sound player; may be null to disable that channel.
   * @param hooks Hook runner; may be null to disable that channel.
   * @param bell_out Stream receiving the bell character.
   * @param drain_timeout Longest wait for queued events on destruction.
   */
  EventDispatcher(DispatchChannels channels, NotifierPtr notifier,
                  std::shared_ptr<SoundPlayer> player,
                  std::shared_ptr<HookRunner> hooks, std::ostream &bell_out,
                  std::chrono::milliseconds drain_timeout =
                      kDefaultDrainTimeout);
  ~EventDispatcher() override;

  EventDispatcher(const EventDispatcher &) = delete;
  EventDispatcher &operator=(const EventDispatcher &) = delete;

  void post(NotifyEvent event) override;

private:
  void worker();
  void dispatch(const NotifyEvent &event);

  DispatchChannels channels_;
  NotifierPtr notifier_;
  std::shared_ptr<SoundPlayer> player_;
  std::shared_ptr<HookRunner> hooks_;
  std::ostream &bell_out_;
  std::chrono::milliseconds drain_timeout_;

  std::thread thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<NotifyEvent> queue_;
  bool busy_{false};
  bool stop_{false};
};

} // namespace ciwait

#endif // CIWAIT_EVENTS_HPP
