#include "pg_pool.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"

namespace coolrouter::db::postgres {

using coolrouter::observability::IntField;

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds acquire_timeout)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? kDefaultMaxConnections : max_connections),
      acquire_timeout_(acquire_timeout.count() <= 0 ? kDefaultAcquireTimeout : acquire_timeout) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  const bool ready = available_.wait_for(lock, acquire_timeout_, [this] {
    return !idle_.empty() || open_ < max_connections_;
  });
  if (!ready) {
    throw std::runtime_error("postgres pool: all " + std::to_string(max_connections_) + " connections busy for " +
                             std::to_string(acquire_timeout_.count()) + "ms");
  }

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Hand(std::move(conn));
  }

  // Open outside the lock; the slot is reserved first.
  ++open_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Hand(std::move(conn));
  } catch (...) {
    {
      std::lock_guard relock(mutex_);
      --open_;
    }
    available_.notify_one();
    throw;
  }
}

// Identities and hashes travel as hex text and are decoded server side.
void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_request",
               "INSERT INTO llm_request(id,requesting_party,provider,model_id,status,created_at_ms,"
               "min_votes,approval_threshold,winning_hash,total_votes_cast,version) "
               "VALUES($1,decode($2,'hex'),$3,$4,$5,$6,$7,$8,decode($9,'hex'),$10,1)");

  conn.prepare("get_request",
               "SELECT id,encode(requesting_party,'hex'),provider,model_id,status,created_at_ms,"
               "min_votes,approval_threshold,encode(winning_hash,'hex'),total_votes_cast,version "
               "FROM llm_request WHERE id=$1");

  conn.prepare("get_request_version", "SELECT version FROM llm_request WHERE id=$1");

  conn.prepare("list_request_ids",
               "SELECT id FROM llm_request WHERE ($1::smallint IS NULL OR status=$1)"
               " ORDER BY created_at_ms, id LIMIT $2");

  conn.prepare("update_request",
               "UPDATE llm_request SET status=$2,winning_hash=decode($3,'hex'),total_votes_cast=$4,"
               "version=version+1 WHERE id=$1 AND version=$5");

  conn.prepare("insert_callback_target",
               "INSERT INTO llm_request_callback_target(request_id,position,pubkey,is_writable) "
               "VALUES($1,$2,decode($3,'hex'),$4)");

  conn.prepare("get_callback_targets",
               "SELECT encode(pubkey,'hex'),is_writable FROM llm_request_callback_target "
               "WHERE request_id=$1 ORDER BY position");

  conn.prepare("insert_vote",
               "INSERT INTO llm_request_vote(request_id,position,oracle,result_hash) "
               "VALUES($1,$2,decode($3,'hex'),decode($4,'hex'))");

  conn.prepare("get_votes",
               "SELECT encode(oracle,'hex'),encode(result_hash,'hex') FROM llm_request_vote "
               "WHERE request_id=$1 ORDER BY position");
}

std::shared_ptr<pqxx::connection> PgPool::Hand(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* returned) {
    if (auto self = pool.lock()) {
      self->Return(returned);
      return;
    }
    delete returned;
  });
}

void PgPool::Return(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      --open_;
      COOLROUTER_LOG_WARN("postgres connection lost; dropped from pool", {IntField("open", static_cast<std::int64_t>(open_))});
    }
  }
  available_.notify_one();
}

} // namespace coolrouter::db::postgres
