/**
 * @file notification.cpp
 * @brief Desktop notifications, sound playback and the terminal bell.
 */
#include "notification.hpp"
#include <array>
#include <utility>

namespace ciwait {

namespace {

constexpr const char *kAppTitle = "ci-wait";

/**
 * Escape characters for use inside AppleScript quoted strings.
 *
 * @param s Raw string to escape.
 * @return Escaped string that can be embedded in AppleScript quotes.
 */
[[maybe_unused]] std::string escape_apple_script(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '\\' || c == '"') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

} // namespace

NotifySendNotifier::NotifySendNotifier(CommandRunner runner)
    : run_(std::move(runner)) {}

void NotifySendNotifier::notify(const std::string &title,
                                const std::string &message) {
  const std::string heading = std::string(kAppTitle) + ": " + title;
#if defined(__APPLE__)
  if (command_exists(run_, "terminal-notifier")) {
    run_("terminal-notifier -title " + shell_escape(heading) + " -message " +
         shell_escape(message));
  } else {
    run_("osascript -e " +
         shell_escape("display notification \"" + escape_apple_script(message) +
                      "\" with title \"" + escape_apple_script(heading) +
                      "\""));
  }
#elif defined(__linux__)
  if (command_exists(run_, "notify-send")) {
    run_("notify-send " + shell_escape(heading) + " " + shell_escape(message));
  }
#else
  (void)heading;
  (void)message;
#endif
}

SoundPlayer::SoundPlayer(CommandRunner runner) : run_(std::move(runner)) {}

bool SoundPlayer::play(const std::string &sound_file) {
  if (sound_file.empty()) {
    return false;
  }
  static const std::array<const char *, 3> players = {"paplay", "pw-play",
                                                      "afplay"};
  for (const char *player : players) {
    if (!command_exists(run_, player)) {
      continue;
    }
    return run_(std::string(player) + " " + shell_escape(sound_file) +
                " >/dev/null 2>&1") == 0;
  }
  return false;
}

std::string SoundPlayer::default_success_sound() {
#if defined(__APPLE__)
  return "/System/Library/Sounds/Glass.aiff";
#else
  return "/usr/share/sounds/freedesktop/stereo/complete.oga";
#endif
}

std::string SoundPlayer::default_failure_sound() {
#if defined(__APPLE__)
  return "/System/Library/Sounds/Basso.aiff";
#else
  return "/usr/share/sounds/freedesktop/stereo/dialog-error.oga";
#endif
}

void ring_bell(std::ostream &out) { out << '\a' << std::flush; }

} // namespace ciwait
