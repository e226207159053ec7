#ifndef CIWAIT_NOTIFICATION_HPP
#define CIWAIT_NOTIFICATION_HPP

#include "util/process.hpp"

#include <memory>
#include <ostream>
#include <string>

namespace ciwait {

/**
 * Interface for surfacing a message to the user outside the terminal.
 */
class Notifier {
public:
  virtual ~Notifier() = default;
  /**
   * Send a notification.
   *
   * @param title Short heading, typically the outcome.
   * @param message Body text.
   */
  virtual void notify(const std::string &title, const std::string &message) = 0;
};

/**
 * Desktop notifier that invokes platform-specific utilities:
 *
 * - Linux: `notify-send`
 * - macOS: `terminal-notifier` (preferred) or `osascript`
 *
 * If no tool is available the request is ignored.
 */
class NotifySendNotifier : public Notifier {
public:
  explicit NotifySendNotifier(CommandRunner runner = run_command);

  void notify(const std::string &title, const std::string &message) override;

private:
  CommandRunner run_;
};

/**
 * Plays a short sound file through the first available command-line player
 * (`paplay`, `pw-play`, `afplay`).
 */
class SoundPlayer {
public:
  explicit SoundPlayer(CommandRunner runner = run_command);

  /**
   * Play @p sound_file.
   *
   * @return `true` when a player accepted the file.
   */
  bool play(const std::string &sound_file);

  /// Platform default sound for a successful run.
  static std::string default_success_sound();

  /// Platform default sound for a failed run.
  static std::string default_failure_sound();

private:
  CommandRunner run_;
};

/// Write the terminal bell character to @p out.
void ring_bell(std::ostream &out);

using NotifierPtr = std::shared_ptr<Notifier>;

} // namespace ciwait

#endif // CIWAIT_NOTIFICATION_HPP
