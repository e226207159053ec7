/**
 * @file hook.hpp
 * @brief User hooks fired on CI session events.
 *
 * Declares hook action types, settings, and the HookRunner that executes the
 * actions configured for an event. The runner is synchronous; it is driven
 * from the EventDispatcher worker thread so the poll loop never waits on it.
 */

#ifndef CIWAIT_HOOK_HPP
#define CIWAIT_HOOK_HPP

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ciwait {

/** \brief Supported hook action backends. */
enum class HookActionType {
  Command, ///< Run a shell command
  Http     ///< Send the event payload to a URL
};

/** \brief Action executed when a hook event fires. */
struct HookAction {
  HookActionType type{HookActionType::Command};
  std::string command;        ///< Shell command for Command actions
  std::string endpoint;       ///< URL for Http actions
  std::string method{"POST"}; ///< HTTP method for Http actions
  std::vector<std::pair<std::string, std::string>> headers;
};

/** \brief Event payload delivered to hook actions. */
struct HookEvent {
  std::string name; ///< "success", "failure" or "increment"
  nlohmann::json data = nlohmann::json::object();
};

/** \brief Hook configuration. */
struct HookSettings {
  bool enabled{true};
  /// Actions run for terminal events (success and failure).
  std::vector<HookAction> default_actions;
  /// Actions for a specific event; replaces the defaults for that event.
  std::unordered_map<std::string, std::vector<HookAction>> event_actions;

  /// Whether any action is configured at all.
  bool has_actions() const;
};

/**
 * Initialize libcurl once for the whole process. Called from main before any
 * thread starts; later calls return the first result.
 *
 * @return Whether curl_global_init succeeded.
 */
bool ensure_curl_initialized();

/**
 * Executes the hook actions configured for an event.
 *
 * Command actions see the event name and JSON payload in the
 * `CIWAIT_HOOK_EVENT` and `CIWAIT_HOOK_PAYLOAD` environment variables. HTTP
 * actions send the payload as the request body.
 */
class HookRunner {
public:
  using CommandExecutor = std::function<int(
      const HookAction &, const HookEvent &, const std::string &)>;
  using HttpExecutor = std::function<long(const HookAction &, const HookEvent &,
                                          const std::string &)>;

  explicit HookRunner(HookSettings settings,
                      CommandExecutor command_executor = CommandExecutor{},
                      HttpExecutor http_executor = HttpExecutor{});

  /**
   * Run every action configured for @p event.
   *
   * @return Number of actions that reported success.
   * @throws std::exception Propagated from an executor; the caller is
   *         expected to contain it.
   */
  std::size_t run(const HookEvent &event);

  /// Immutable hook settings.
  const HookSettings &settings() const { return settings_; }

private:
  const std::vector<HookAction> *actions_for(const std::string &event) const;
  bool execute_command(const HookAction &action, const HookEvent &event,
                       const std::string &payload);
  bool execute_http(const HookAction &action, const HookEvent &event,
                    const std::string &payload);

  HookSettings settings_;
  CommandExecutor command_executor_;
  HttpExecutor http_executor_;
};

} // namespace ciwait

#endif // CIWAIT_HOOK_HPP
