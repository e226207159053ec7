#include "hook.hpp"
#include "log.hpp"
#include "util/process.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <curl/curl.h>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace ciwait {

namespace {

std::shared_ptr<spdlog::logger> hook_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("hooks");
  }();
  return logger;
}

std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return s;
}

bool is_terminal_event(const std::string &name) {
  return name == "success" || name == "failure";
}

int run_hook_command(const HookAction &action, const HookEvent &event,
                     const std::string &payload) {
  // Event data goes into the child's environment only.
  std::string cmd = "CIWAIT_HOOK_EVENT=" + shell_escape(event.name) +
                    " CIWAIT_HOOK_PAYLOAD=" + shell_escape(payload) +
                    " /bin/sh -c " + shell_escape(action.command);
  return run_command(cmd);
}

long post_hook_payload(const HookAction &action, const HookEvent &,
                       const std::string &payload) {
  if (!ensure_curl_initialized()) {
    throw std::runtime_error("libcurl is not available for hook requests");
  }
  CURL *curl = curl_easy_init();
  if (!curl) {
    throw std::runtime_error("Failed to initialize curl for hook request");
  }
  curl_easy_setopt(curl, CURLOPT_URL, action.endpoint.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, 10L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  struct curl_slist *headers = nullptr;
  bool has_content_type = false;
  for (const auto &[name, value] : action.headers) {
    headers = curl_slist_append(headers, (name + ": " + value).c_str());
    if (upper(name) == "CONTENT-TYPE") {
      has_content_type = true;
    }
  }
  if (!has_content_type) {
    headers = curl_slist_append(headers, "Content-Type: application/json");
  }
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  std::string method = upper(action.method);
  if (method == "GET") {
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  } else {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(payload.size()));
    if (!method.empty() && method != "POST") {
      curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
  }
  CURLcode res = curl_easy_perform(curl);
  long status = 0;
  if (res == CURLE_OK) {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  }
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);
  if (res != CURLE_OK) {
    throw std::runtime_error(std::string("Hook HTTP request failed: ") +
                             curl_easy_strerror(res));
  }
  return status;
}

} // namespace

bool ensure_curl_initialized() {
  static std::once_flag flag;
  static CURLcode result = CURLE_OK;
  std::call_once(flag, [] {
    result = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (result != CURLE_OK) {
      hook_log()->error("curl_global_init failed: {}",
                        curl_easy_strerror(result));
    }
  });
  return result == CURLE_OK;
}

bool HookSettings::has_actions() const {
  if (!default_actions.empty()) {
    return true;
  }
  return std::any_of(event_actions.begin(), event_actions.end(),
                     [](const auto &kv) { return !kv.second.empty(); });
}

HookRunner::HookRunner(HookSettings settings, CommandExecutor command_executor,
                       HttpExecutor http_executor)
    : settings_(std::move(settings)),
      command_executor_(std::move(command_executor)),
      http_executor_(std::move(http_executor)) {
  if (!command_executor_) {
    command_executor_ = run_hook_command;
  }
  if (!http_executor_) {
    http_executor_ = post_hook_payload;
  }
}

const std::vector<HookAction> *
HookRunner::actions_for(const std::string &event) const {
  auto it = settings_.event_actions.find(event);
  if (it != settings_.event_actions.end()) {
    return &it->second;
  }
  if (is_terminal_event(event)) {
    return &settings_.default_actions;
  }
  return nullptr;
}

std::size_t HookRunner::run(const HookEvent &event) {
  if (!settings_.enabled) {
    return 0;
  }
  const auto *actions = actions_for(event.name);
  if (actions == nullptr || actions->empty()) {
    hook_log()->debug("No hook actions for event '{}'", event.name);
    return 0;
  }
  const std::string payload =
      nlohmann::json{{"event", event.name},
                     {"timestamp",
                      iso_timestamp(std::chrono::system_clock::now())},
                     {"data", event.data}}
          .dump();
  std::size_t succeeded = 0;
  for (const auto &action : *actions) {
    bool ok = action.type == HookActionType::Command
                  ? execute_command(action, event, payload)
                  : execute_http(action, event, payload);
    if (ok) {
      ++succeeded;
    }
  }
  return succeeded;
}

bool HookRunner::execute_command(const HookAction &action,
                                 const HookEvent &event,
                                 const std::string &payload) {
  int rc = command_executor_(action, event, payload);
  if (rc != 0) {
    hook_log()->warn("Hook command '{}' exited with status {}", action.command,
                     rc);
    return false;
  }
  hook_log()->debug("Hook command '{}' finished", action.command);
  return true;
}

bool HookRunner::execute_http(const HookAction &action, const HookEvent &event,
                              const std::string &payload) {
  long status = http_executor_(action, event, payload);
  if (status >= 200 && status < 300) {
    hook_log()->debug("Hook {} {} responded with {}", action.method,
                      action.endpoint, status);
    return true;
  }
  hook_log()->warn("Hook {} {} responded with status {}", action.method,
                   action.endpoint, status);
  return false;
}

} // namespace ciwait
