/**
 * @file history.cpp
 * @brief Implements the rolling duration history and its median estimate.
 */
#include "history.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <vector>

namespace ciwait {

namespace {
std::shared_ptr<spdlog::logger> history_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("history");
  }();
  return logger;
}

bool all_digits(const std::string &token) {
  return !token.empty() &&
         std::all_of(token.begin(), token.end(), [](unsigned char c) {
           return std::isdigit(c) != 0;
         });
}
} // namespace

std::string to_string(Category category) {
  return category == Category::Success ? "success" : "failure";
}

RunDuration median_estimate(const RollingHistory &history) {
  if (history.empty()) {
    return 0;
  }
  std::vector<RunDuration> sorted(history.begin(), history.end());
  std::sort(sorted.begin(), sorted.end());
  std::size_t rank = std::max<std::size_t>(1, sorted.size() / 2);
  return sorted[rank - 1];
}

RollingHistoryStore::RollingHistoryStore(StateStore &store,
                                         std::size_t capacity)
    : store_(store), capacity_(capacity) {}

std::string RollingHistoryStore::key_for(Category category) {
  return "rolling-elapsed-" + to_string(category);
}

RollingHistory RollingHistoryStore::fetch(Category category) const {
  RollingHistory history;
  auto raw = store_.get(key_for(category));
  if (!raw) {
    return history;
  }
  std::istringstream in(*raw);
  std::string token;
  while (in >> token) {
    if (!all_digits(token) || token.size() > 18) {
      history_log()->debug("Skipping malformed {} history entry '{}'",
                           to_string(category), token);
      continue;
    }
    history.push_back(std::stoll(token));
  }
  while (history.size() > capacity_) {
    history.pop_front();
  }
  return history;
}

RunDuration RollingHistoryStore::median(Category category) const {
  return median_estimate(fetch(category));
}

void RollingHistoryStore::clear(Category category) {
  store_.unset(key_for(category));
  history_log()->info("Cleared {} history", to_string(category));
}

std::optional<RunDuration>
RollingHistoryStore::update(Category category,
                            std::optional<RunDuration> duration,
                            bool want_median) {
  if (capacity_ == 0) {
    return want_median ? std::optional<RunDuration>(0) : std::nullopt;
  }
  if (!duration) {
    return want_median ? std::optional<RunDuration>(median(category))
                       : std::nullopt;
  }
  RollingHistory history = fetch(category);
  while (history.size() > capacity_ - 1) {
    history.pop_front();
  }
  history.push_back(std::max<RunDuration>(0, *duration));

  std::ostringstream out;
  for (std::size_t i = 0; i < history.size(); ++i) {
    if (i != 0) {
      out << ' ';
    }
    out << history[i];
  }
  store_.set(key_for(category), out.str());
  history_log()->debug("{} history now [{}]", to_string(category), out.str());

  if (!want_median) {
    return std::nullopt;
  }
  return median_estimate(history);
}

} // namespace ciwait
