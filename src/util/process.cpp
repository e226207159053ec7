#include "util/process.hpp"
#include "log.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <sys/wait.h>

namespace ciwait {

namespace {
std::shared_ptr<spdlog::logger> process_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("process");
  }();
  return logger;
}

int decode_status(int status) {
  if (status == -1) {
    return -1;
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
}

struct PipeCloser {
  int *status;
  void operator()(FILE *f) const { *status = pclose(f); }
};
} // namespace

ProcessResult run_captured(const std::string &command) {
  ProcessResult result;
  process_log()->trace("exec: {}", command);
  int status = -1;
  {
    std::unique_ptr<FILE, PipeCloser> pipe(popen(command.c_str(), "r"),
                                           PipeCloser{&status});
    if (!pipe) {
      process_log()->debug("popen failed for '{}'", command);
      return result;
    }
    std::array<char, 4096> buf;
    std::size_t n = 0;
    while ((n = std::fread(buf.data(), 1, buf.size(), pipe.get())) > 0) {
      result.output.append(buf.data(), n);
    }
  }
  result.exit_code = decode_status(status);
  process_log()->trace("exit {} from '{}'", result.exit_code, command);
  return result;
}

int run_command(const std::string &command) {
  process_log()->trace("system: {}", command);
  return decode_status(std::system(command.c_str()));
}

std::string shell_escape(const std::string &s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

bool command_exists(const CommandRunner &run, const std::string &tool) {
  return run("command -v " + shell_escape(tool) + " >/dev/null 2>&1") == 0;
}

std::string chomp(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
    s.pop_back();
  }
  return s;
}

} // namespace ciwait
