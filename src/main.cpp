#include "app.hpp"
#include "hook.hpp"
#include "log.hpp"

#include <exception>
#include <spdlog/spdlog.h>

/**
 * Program entry point. Runs one ci-wait command and returns its exit status.
 */
int main(int argc, char **argv) {
  if (!ciwait::ensure_curl_initialized()) {
    ciwait::ensure_default_logger();
    ciwait::category_logger("app")->warn("HTTP hooks are unavailable");
  }
  ciwait::App app;
  int ret = 1;
  try {
    ret = app.run(argc, argv);
  } catch (const std::exception &e) {
    ciwait::ensure_default_logger();
    ciwait::category_logger("app")->critical("Unhandled error: {}", e.what());
  }
  spdlog::shutdown();
  return ret;
}
