#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace coolrouter::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode)
    : db_(std::move(db)), slot_(db_->LockTransactions()), mode_(mode) {
  db_->Exec(mode_ == TxMode::kReadOnly ? "BEGIN DEFERRED;" : "BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      COOLROUTER_LOG_WARN("sqlite rollback failed", {coolrouter::observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  slot_.unlock();
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
  slot_.unlock();
}

} // namespace coolrouter::db::sqlite
