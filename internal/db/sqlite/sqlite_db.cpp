#include "sqlite_db.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace coolrouter::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, int busy_timeout_ms) : path_(std::move(path)) {
  if (path_.empty()) {
    throw std::invalid_argument("sqlite database path is empty");
  }

  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + msg);
  }

  Configure(busy_timeout_ms);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

int SqliteDB::SchemaVersion() {
  sqlite3_stmt* st = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &st, nullptr), db_, "prepare user_version");

  int version = 0;
  if (sqlite3_step(st) == SQLITE_ROW) {
    version = sqlite3_column_int(st, 0);
  }
  sqlite3_finalize(st);
  return version;
}

void SqliteDB::Apply(const sql::Migration& migration) {
  auto lock = LockTransactions();
  Exec("BEGIN IMMEDIATE;");
  try {
    Exec(migration.sql);
    Exec("PRAGMA user_version = " + std::to_string(migration.version) + ";");
    Exec("COMMIT;");
  } catch (const std::exception& e) {
    try {
      Exec("ROLLBACK;");
    } catch (const std::exception& rollback_error) {
      COOLROUTER_LOG_WARN("sqlite migration rollback failed", {observability::StringField("error", rollback_error.what())});
    }
    throw std::runtime_error("sqlite migration " + std::to_string(migration.version) + ": " + e.what());
  }
}

void SqliteDB::Configure(int busy_timeout_ms) {
  // WAL lets readers proceed while a BEGIN IMMEDIATE writer holds the lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // callback targets and votes cascade with their request
  Exec("PRAGMA foreign_keys=ON;");

  ThrowIf(sqlite3_busy_timeout(db_, busy_timeout_ms), db_, "busy_timeout");
}

} // namespace coolrouter::db::sqlite
