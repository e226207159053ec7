/**
 * @file state_store.cpp
 * @brief git-config and SQLite backends for the ci-wait state store.
 */
#include "state_store.hpp"
#include "log.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

namespace ciwait {

namespace {
std::shared_ptr<spdlog::logger> state_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("state");
  }();
  return logger;
}

constexpr const char *kGitNamespace = "ci-wait.";

std::string git_key(const std::string &key) {
  return shell_escape(kGitNamespace + key);
}

/// Finalizes a prepared statement when leaving scope.
struct StatementGuard {
  sqlite3_stmt *stmt = nullptr;
  ~StatementGuard() {
    if (stmt != nullptr) {
      sqlite3_finalize(stmt);
    }
  }
};
} // namespace

GitConfigStore::GitConfigStore(ProcessRunner runner)
    : run_(std::move(runner)) {}

std::optional<std::string> GitConfigStore::get(const std::string &key) const {
  auto result = run_("git config --get " + git_key(key) + " 2>/dev/null");
  if (result.exit_code != 0) {
    // 1 means the key is unset; anything else is a broken config or no repo.
    if (result.exit_code != 1) {
      state_log()->debug("git config --get {} exited {}", key,
                         result.exit_code);
    }
    return std::nullopt;
  }
  return chomp(result.output);
}

void GitConfigStore::set(const std::string &key, const std::string &value) {
  auto result = run_("git config " + git_key(key) + " " +
                     shell_escape(value) + " 2>/dev/null");
  if (result.exit_code != 0) {
    throw std::runtime_error("git config failed to store " + std::string(
                                 kGitNamespace) + key);
  }
  state_log()->debug("Stored {}{} = '{}'", kGitNamespace, key, value);
}

void GitConfigStore::unset(const std::string &key) {
  // Exit status 5 signals an absent key.
  auto result =
      run_("git config --unset-all " + git_key(key) + " 2>/dev/null");
  if (result.exit_code != 0 && result.exit_code != 5) {
    throw std::runtime_error("git config failed to remove " +
                             std::string(kGitNamespace) + key + " (exit " +
                             std::to_string(result.exit_code) + ")");
  }
  state_log()->debug("Unset {}{} (exit {})", kGitNamespace, key,
                     result.exit_code);
}

SqliteStateStore::SqliteStateStore(const std::string &db_path) {
  state_log()->debug("Opening state database {}", db_path);
  if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("Failed to open state database " + db_path +
                             ": " + msg);
  }
  const char *sql = "CREATE TABLE IF NOT EXISTS state("
                    "key TEXT PRIMARY KEY, value TEXT NOT NULL);";
  char *err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "";
    sqlite3_free(err);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("Failed to create state table: " + msg);
  }
}

SqliteStateStore::~SqliteStateStore() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

std::optional<std::string> SqliteStateStore::get(const std::string &key) const {
  StatementGuard guard;
  if (sqlite3_prepare_v2(db_, "SELECT value FROM state WHERE key=?", -1,
                         &guard.stmt, nullptr) != SQLITE_OK) {
    state_log()->warn("Failed to prepare state lookup: {}",
                      sqlite3_errmsg(db_));
    return std::nullopt;
  }
  sqlite3_bind_text(guard.stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(guard.stmt) != SQLITE_ROW) {
    return std::nullopt;
  }
  const unsigned char *text = sqlite3_column_text(guard.stmt, 0);
  return std::string(text ? reinterpret_cast<const char *>(text) : "");
}

void SqliteStateStore::set(const std::string &key, const std::string &value) {
  StatementGuard guard;
  const char *sql = "INSERT OR REPLACE INTO state(key,value) VALUES(?,?)";
  if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
    throw std::runtime_error("Failed to prepare state update");
  }
  sqlite3_bind_text(guard.stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(guard.stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
    throw std::runtime_error("Failed to store state key " + key);
  }
}

void SqliteStateStore::unset(const std::string &key) {
  StatementGuard guard;
  if (sqlite3_prepare_v2(db_, "DELETE FROM state WHERE key=?", -1,
                         &guard.stmt, nullptr) != SQLITE_OK) {
    state_log()->warn("Failed to prepare state delete: {}",
                      sqlite3_errmsg(db_));
    return;
  }
  sqlite3_bind_text(guard.stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
    state_log()->warn("Failed to delete state key {}", key);
  }
}

} // namespace ciwait
