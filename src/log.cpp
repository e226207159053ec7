#include "log.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include <zlib.h>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

namespace fs = std::filesystem;

constexpr const char *kRootLoggerName = "ciwait";
constexpr std::size_t kMaxLogFileBytes = 2 * 1024 * 1024;

std::weak_ptr<spdlog::logger> g_root;
// Every logger writes through this sink so a file sink added after the first
// log line still receives output from already-cached category loggers.
std::shared_ptr<spdlog::sinks::dist_sink_mt> g_fanout;
bool g_file_attached = false;
std::mutex g_mutex;
std::once_flag g_pool_once;

std::shared_ptr<spdlog::details::thread_pool> shared_pool() {
  std::call_once(g_pool_once, [] { spdlog::init_thread_pool(8192, 1); });
  return spdlog::thread_pool();
}

/// Path of rotation slot @p index ("ci-wait.log" -> "ci-wait.2.log").
fs::path rotated_path(const std::string &base, std::size_t index) {
  fs::path path(base);
  if (index == 0) {
    return path;
  }
  fs::path rotated = path.parent_path() / path.stem();
  rotated += "." + std::to_string(index);
  rotated += path.extension();
  return rotated;
}

bool gzip_file(const fs::path &source) {
  std::ifstream in(source, std::ios::binary);
  if (!in) {
    return false;
  }
  const std::string target = source.string() + ".gz";
  gzFile gz = gzopen(target.c_str(), "wb");
  if (gz == nullptr) {
    return false;
  }
  char chunk[8192];
  bool ok = true;
  while (ok && in) {
    in.read(chunk, sizeof(chunk));
    auto got = in.gcount();
    if (got > 0 && gzwrite(gz, chunk, static_cast<unsigned>(got)) != got) {
      ok = false;
    }
  }
  gzclose(gz);
  std::error_code ec;
  fs::remove(ok ? source : fs::path(target), ec);
  return ok;
}

/**
 * Shift compressed rotations up by one slot and compress the newest plain
 * rotation. Runs right before spdlog reopens the base file.
 */
void roll_compressed(const std::string &base, std::size_t max_files) {
  std::error_code ec;
  fs::remove(rotated_path(base, max_files).string() + ".gz", ec);
  for (std::size_t i = max_files; i > 1; --i) {
    fs::path from(rotated_path(base, i - 1).string() + ".gz");
    if (fs::exists(from, ec)) {
      fs::rename(from, rotated_path(base, i).string() + ".gz", ec);
    }
  }
  fs::path newest = rotated_path(base, 1);
  if (fs::exists(newest, ec) && !gzip_file(newest)) {
    ciwait::category_logger("logging")
        ->warn("Failed to compress rotated log {}", newest.string());
  }
}

std::shared_ptr<spdlog::logger>
make_async(const std::string &name, const std::vector<spdlog::sink_ptr> &sinks) {
  return std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), shared_pool(),
      spdlog::async_overflow_policy::block);
}

} // namespace

namespace ciwait {

void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files,
                 bool compress_rotations) {
  std::unique_lock<std::mutex> lock(g_mutex);
  auto logger = spdlog::get(kRootLoggerName);
  if (!logger) {
    g_fanout = std::make_shared<spdlog::sinks::dist_sink_mt>();
    g_fanout->add_sink(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    logger = make_async(kRootLoggerName, {g_fanout});
    spdlog::set_default_logger(logger);
    g_root = logger;
  }
  if (!file.empty() && !g_file_attached) {
    if (rotate_files == 0) {
      g_fanout->add_sink(
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false));
    } else {
      spdlog::file_event_handlers handlers;
      if (compress_rotations) {
        handlers.before_open = [rotate_files](const spdlog::filename_t &f) {
          roll_compressed(spdlog::details::os::filename_to_str(f),
                          rotate_files);
        };
      }
      g_fanout->add_sink(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          file, kMaxLogFileBytes, rotate_files, false, handlers));
    }
    g_file_attached = true;
  }
  lock.unlock();
  spdlog::set_level(level);
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger ready (level={}, file='{}', rotate={}, compress={})",
                spdlog::level::to_string_view(level), file, rotate_files,
                compress_rotations);
}

void ensure_default_logger() {
  auto current = spdlog::default_logger();
  auto ours = g_root.lock();
  if (!current || !ours || current.get() != ours.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  const std::string name = std::string(kRootLoggerName) + "." + category;
  std::unique_lock<std::mutex> lock(g_mutex);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto root = g_root.lock();
  if (!root) {
    lock.unlock();
    init_logger(spdlog::level::info);
    lock.lock();
    if (auto existing = spdlog::get(name)) {
      return existing;
    }
    root = g_root.lock();
  }
  auto logger = make_async(name, {g_fanout});
  logger->set_level(root->level());
  spdlog::register_logger(logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  for (const auto &[category, level] : overrides) {
    category_logger(category)->set_level(level);
  }
  if (!overrides.empty()) {
    category_logger("logging")
        ->debug("Applied {} log category override(s)", overrides.size());
  }
}

} // namespace ciwait
