#include "snapshot.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace ciwait {

namespace {

std::vector<std::string> split_tabs(const std::string &line) {
  std::vector<std::string> fields;
  std::size_t start = 0;
  while (true) {
    auto tab = line.find('\t', start);
    if (tab == std::string::npos) {
      fields.push_back(line.substr(start));
      break;
    }
    fields.push_back(line.substr(start, tab - start));
    start = tab + 1;
  }
  return fields;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)); }

} // namespace

int version_compare(const std::string &a, const std::string &b) {
  std::size_t i = 0;
  std::size_t j = 0;
  while (i < a.size() && j < b.size()) {
    if (is_digit(a[i]) && is_digit(b[j])) {
      // Leading zeros do not change the numeric value.
      while (i < a.size() && a[i] == '0') {
        ++i;
      }
      while (j < b.size() && b[j] == '0') {
        ++j;
      }
      std::size_t ei = i;
      std::size_t ej = j;
      while (ei < a.size() && is_digit(a[ei])) {
        ++ei;
      }
      while (ej < b.size() && is_digit(b[ej])) {
        ++ej;
      }
      std::size_t len_a = ei - i;
      std::size_t len_b = ej - j;
      if (len_a != len_b) {
        return len_a < len_b ? -1 : 1;
      }
      int cmp = a.compare(i, len_a, b, j, len_b);
      if (cmp != 0) {
        return cmp;
      }
      i = ei;
      j = ej;
      continue;
    }
    if (a[i] != b[j]) {
      return static_cast<unsigned char>(a[i]) < static_cast<unsigned char>(b[j])
                 ? -1
                 : 1;
    }
    ++i;
    ++j;
  }
  if (i < a.size()) {
    return 1;
  }
  if (j < b.size()) {
    return -1;
  }
  return 0;
}

CheckSetSnapshot parse_snapshot(const std::string &output) {
  CheckSetSnapshot snap;
  std::string longest;
  bool have_duration = false;

  std::istringstream in(output);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    auto fields = split_tabs(line);
    if (fields.size() < 2) {
      continue;
    }
    ++snap.total;
    const std::string &status = fields[1];
    std::string status_lower = lower(status);
    if (status == "pending") {
      ++snap.pending;
    } else if (status_lower.find("fail") != std::string::npos) {
      ++snap.failed;
    } else if (status_lower.find("pass") != std::string::npos) {
      ++snap.passed;
    }
    if (fields.size() >= 3) {
      if (!have_duration || version_compare(fields[2], longest) > 0) {
        longest = fields[2];
        have_duration = true;
      }
    }
  }
  if (have_duration) {
    snap.longest_elapsed = parse_elapsed(longest);
  }
  return snap;
}

} // namespace ciwait
