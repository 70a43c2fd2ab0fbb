#pragma once

namespace coolrouter::db {

/*
  One unit of work against the request store.

  - Reads inside the transaction see its own writes.
  - Commit() publishes every write at once; nothing is visible before.
  - Rollback() discards the writes.
  - The destructor rolls back if Commit() was never reached, so an
    exception thrown between update and commit (a rejected callback
    during fulfill) leaves the stored record untouched.
  - A read-only transaction refuses writes with ErrorCode::ReadOnly
    and never takes the backend's write lock.

                 read-write           read-only
  SQLite         BEGIN IMMEDIATE      BEGIN DEFERRED
  Postgres       pqxx::work           pqxx::read_transaction
  Memory         snapshot + write set snapshot
*/

enum class TxMode { kReadWrite, kReadOnly };

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;

  virtual TxMode Mode() const = 0;

  bool IsReadOnly() const {
    return Mode() == TxMode::kReadOnly;
  }
};

}
