#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace coolrouter::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  The connection is opened FULLMUTEX and shared by every transaction.
  A connection carries at most one open transaction, so transactions
  hold LockTransactions() from BEGIN until COMMIT or ROLLBACK. Other
  processes on the same file are kept out by BEGIN IMMEDIATE and wait
  out busy_timeout.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  static constexpr int kDefaultBusyTimeoutMs = 5000;

  explicit SqliteDB(std::string path, int busy_timeout_ms = kDefaultBusyTimeoutMs);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute one or more SQL statements without results.
  void Exec(const std::string& sql);

  std::unique_lock<std::mutex> LockTransactions() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

  // PRAGMA user_version
  int  SchemaVersion() override;
  void Apply(const sql::Migration& migration) override;

 private:
  void Configure(int busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace coolrouter::db::sqlite
