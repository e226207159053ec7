#include "util/elapsed.hpp"

#include <cctype>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace ciwait {

namespace {

constexpr RunDuration kMaxDuration = std::numeric_limits<RunDuration>::max();

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)); }

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)); }

/// Consume a run of digits starting at @p pos; false when there is none or
/// when it does not fit in a RunDuration.
bool read_number(const std::string &s, std::size_t &pos, RunDuration &out) {
  std::size_t start = pos;
  RunDuration value = 0;
  while (pos < s.size() && is_digit(s[pos])) {
    if (value > (kMaxDuration - 9) / 10) {
      return false;
    }
    value = value * 10 + (s[pos] - '0');
    ++pos;
  }
  out = value;
  return pos > start;
}

void skip_spaces(const std::string &s, std::size_t &pos) {
  while (pos < s.size() && is_space(s[pos])) {
    ++pos;
  }
}

} // namespace

std::string format_elapsed(RunDuration seconds) {
  if (seconds < 0) {
    seconds = 0;
  }
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%lldm %02llds",
                static_cast<long long>(seconds / 60),
                static_cast<long long>(seconds % 60));
  return buf;
}

RunDuration parse_elapsed(const std::string &text) {
  std::size_t pos = 0;
  skip_spaces(text, pos);

  RunDuration first = 0;
  if (!read_number(text, pos, first) || pos >= text.size()) {
    return 0;
  }

  RunDuration minutes = 0;
  RunDuration secs = 0;
  if (text[pos] == 'm') {
    ++pos;
    minutes = first;
    skip_spaces(text, pos);
    if (!read_number(text, pos, secs) || pos >= text.size() ||
        text[pos] != 's') {
      return 0;
    }
  } else if (text[pos] == 's') {
    secs = first;
  } else {
    return 0;
  }
  ++pos;

  skip_spaces(text, pos);
  if (pos != text.size() || minutes > (kMaxDuration - secs) / 60) {
    return 0;
  }
  return minutes * 60 + secs;
}

std::chrono::seconds parse_duration(const std::string &text) {
  if (text.empty()) {
    return std::chrono::seconds{0};
  }
  RunDuration total = 0;
  std::size_t pos = 0;
  auto add = [&](RunDuration value, RunDuration unit) {
    if (value > (kMaxDuration - total) / unit) {
      throw std::runtime_error("Duration '" + text + "' is too large");
    }
    total += value * unit;
  };
  bool saw_unit = false;
  while (pos < text.size()) {
    RunDuration value = 0;
    if (!read_number(text, pos, value)) {
      throw std::runtime_error("Invalid duration '" + text + "'");
    }
    if (pos == text.size()) {
      if (saw_unit) {
        throw std::runtime_error("Missing unit in duration '" + text + "'");
      }
      add(value, 1);
      break;
    }
    switch (std::tolower(static_cast<unsigned char>(text[pos++]))) {
    case 's':
      add(value, 1);
      break;
    case 'm':
      add(value, 60);
      break;
    case 'h':
      add(value, 3600);
      break;
    case 'd':
      add(value, 86400);
      break;
    default:
      throw std::runtime_error("Invalid duration unit in '" + text + "'");
    }
    saw_unit = true;
  }
  return std::chrono::seconds{total};
}

} // namespace ciwait
