#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace coolrouter::db::sqlite {

/*
  Owns the connection's transaction slot for its lifetime.

  Read-write transactions use BEGIN IMMEDIATE so the file's write lock
  is taken up front and another process's writer waits out busy_timeout
  instead of failing at COMMIT. Read-only ones use BEGIN DEFERRED and
  only ever take a read snapshot.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const { return db_->Handle(); }

  void   Commit() override;
  void   Rollback() override;
  bool   IsCommitted() const override { return committed_; }
  TxMode Mode() const override { return mode_; }

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> slot_;
  TxMode                       mode_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

}
