#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace coolrouter::db::postgres {

/*
  Holds one pooled connection for its lifetime. Read-write maps to
  pqxx::work (read committed), read-only to pqxx::read_transaction.
*/
class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<PgPool> pool, TxMode mode);
  ~PgTransaction();

  PgTransaction(const PgTransaction&)            = delete;
  PgTransaction& operator=(const PgTransaction&) = delete;

  pqxx::transaction_base& Work() { return *tx_; }

  void   Commit() override;
  void   Rollback() override;
  bool   IsCommitted() const override { return committed_; }
  TxMode Mode() const override { return mode_; }

private:
  std::shared_ptr<pqxx::connection>       conn_;
  std::unique_ptr<pqxx::transaction_base> tx_;
  TxMode                                  mode_;
  bool                                    committed_ = false;
  bool                                    finished_  = false;
};

}
