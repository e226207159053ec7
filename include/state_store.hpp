/**
 * @file state_store.hpp
 * @brief Key/value persistence for `ci-wait.*` settings and history.
 *
 * Keys are given without the `ci-wait.` namespace (for example
 * "slow-poll-seconds"); each backend applies its own scoping.
 */

#ifndef CIWAIT_STATE_STORE_HPP
#define CIWAIT_STATE_STORE_HPP

#include "util/process.hpp"

#include <optional>
#include <sqlite3.h>
#include <string>

namespace ciwait {

/// Abstract repository-scoped key/value store.
class StateStore {
public:
  virtual ~StateStore() = default;

  /// Value stored under @p key, or std::nullopt when absent.
  virtual std::optional<std::string> get(const std::string &key) const = 0;

  /**
   * Store @p value under @p key, replacing any previous value.
   *
   * @throws std::runtime_error When the backend rejects the write.
   */
  virtual void set(const std::string &key, const std::string &value) = 0;

  /// Remove @p key. Removing an absent key is not an error.
  virtual void unset(const std::string &key) = 0;
};

/**
 * Store backed by the current repository's git configuration, using keys of
 * the form `ci-wait.<key>`.
 */
class GitConfigStore : public StateStore {
public:
  explicit GitConfigStore(ProcessRunner runner = run_captured);

  std::optional<std::string> get(const std::string &key) const override;
  void set(const std::string &key, const std::string &value) override;
  void unset(const std::string &key) override;

private:
  ProcessRunner run_;
};

/**
 * RAII wrapper around an SQLite database holding a single `state` table.
 *
 * Used when the user points `state_db` at a file instead of writing into the
 * repository configuration, and by tests with ":memory:".
 */
class SqliteStateStore : public StateStore {
public:
  /**
   * Open or create the database at @p db_path.
   *
   * @throws std::runtime_error When the database cannot be opened or the
   *         schema cannot be created.
   */
  explicit SqliteStateStore(const std::string &db_path);
  ~SqliteStateStore() override;

  SqliteStateStore(const SqliteStateStore &) = delete;
  SqliteStateStore &operator=(const SqliteStateStore &) = delete;

  std::optional<std::string> get(const std::string &key) const override;
  void set(const std::string &key, const std::string &value) override;
  void unset(const std::string &key) override;

private:
  sqlite3 *db_ = nullptr;
};

} // namespace ciwait

#endif // CIWAIT_STATE_STORE_HPP
