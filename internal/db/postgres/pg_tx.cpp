#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace coolrouter::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, TxMode mode) : conn_(pool->Acquire()), mode_(mode) {
  if (mode_ == TxMode::kReadOnly) {
    tx_ = std::make_unique<pqxx::read_transaction>(*conn_);
  } else {
    tx_ = std::make_unique<pqxx::work>(*conn_);
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      COOLROUTER_LOG_WARN("postgres abort failed", {coolrouter::observability::StringField("error", e.what())});
    }
  }
  // the work must be gone before its connection returns to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
