#include "migrations.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace coolrouter::db::sql {

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  const int latest  = ordered.empty() ? 0 : ordered.back().version;
  int       current = executor.SchemaVersion();

  if (current > latest) {
    throw std::runtime_error("database schema version " + std::to_string(current) + " is newer than supported version " +
                             std::to_string(latest));
  }

  for (const auto& migration : ordered) {
    if (migration.version <= current) {
      continue;
    }
    executor.Apply(migration);
    current = migration.version;
    COOLROUTER_LOG_INFO("Schema migrated", {observability::IntField("version", current)});
  }
  return current;
}

const std::vector<Migration>& SqliteSchema() {
  static const std::vector<Migration> kSchema = {
      {1,
      "CREATE TABLE IF NOT EXISTS llm_request ("
      " id TEXT PRIMARY KEY CHECK(length(CAST(id AS BLOB)) <= 64),"
      " requesting_party BLOB NOT NULL CHECK(length(requesting_party) = 32),"
      " provider TEXT NOT NULL CHECK(length(CAST(provider AS BLOB)) <= 64),"
      " model_id TEXT NOT NULL CHECK(length(CAST(model_id AS BLOB)) <= 64),"
      " status INTEGER NOT NULL,"
      " created_at_ms INTEGER NOT NULL,"
      " min_votes INTEGER NOT NULL,"
      " approval_threshold INTEGER NOT NULL,"
      " winning_hash BLOB CHECK(winning_hash IS NULL OR length(winning_hash) = 32),"
      " total_votes_cast INTEGER NOT NULL CHECK(total_votes_cast BETWEEN 0 AND 32),"
      " version INTEGER NOT NULL);"
      "CREATE TABLE IF NOT EXISTS llm_request_callback_target ("
      " request_id TEXT NOT NULL REFERENCES llm_request(id) ON DELETE CASCADE,"
      " position INTEGER NOT NULL CHECK(position BETWEEN 0 AND 31),"
      " pubkey BLOB NOT NULL CHECK(length(pubkey) = 32),"
      " is_writable INTEGER NOT NULL,"
      " PRIMARY KEY(request_id, position));"
      "CREATE TABLE IF NOT EXISTS llm_request_vote ("
      " request_id TEXT NOT NULL REFERENCES llm_request(id) ON DELETE CASCADE,"
      " position INTEGER NOT NULL CHECK(position BETWEEN 0 AND 31),"
      " oracle BLOB NOT NULL CHECK(length(oracle) = 32),"
      " result_hash BLOB NOT NULL CHECK(length(result_hash) = 32),"
      " PRIMARY KEY(request_id, position),"
      " UNIQUE(request_id, oracle));"},
      // ListRequests order
      {2, "CREATE INDEX IF NOT EXISTS llm_request_created_idx ON llm_request(created_at_ms, id);"},
      // status filtered listing
      {3, "CREATE INDEX IF NOT EXISTS llm_request_status_idx ON llm_request(status, created_at_ms, id);"},
  };
  return kSchema;
}

const std::vector<Migration>& PostgresSchema() {
  static const std::vector<Migration> kSchema = {
      {1,
      "CREATE TABLE IF NOT EXISTS llm_request ("
      " id TEXT PRIMARY KEY CHECK(octet_length(id) <= 64),"
      " requesting_party BYTEA NOT NULL CHECK(length(requesting_party) = 32),"
      " provider TEXT NOT NULL CHECK(octet_length(provider) <= 64),"
      " model_id TEXT NOT NULL CHECK(octet_length(model_id) <= 64),"
      " status SMALLINT NOT NULL,"
      " created_at_ms BIGINT NOT NULL,"
      " min_votes SMALLINT NOT NULL,"
      " approval_threshold SMALLINT NOT NULL,"
      " winning_hash BYTEA CHECK(winning_hash IS NULL OR length(winning_hash) = 32),"
      " total_votes_cast INTEGER NOT NULL CHECK(total_votes_cast BETWEEN 0 AND 32),"
      " version BIGINT NOT NULL);"
      "CREATE TABLE IF NOT EXISTS llm_request_callback_target ("
      " request_id TEXT NOT NULL REFERENCES llm_request(id) ON DELETE CASCADE,"
      " position SMALLINT NOT NULL CHECK(position BETWEEN 0 AND 31),"
      " pubkey BYTEA NOT NULL CHECK(length(pubkey) = 32),"
      " is_writable BOOLEAN NOT NULL,"
      " PRIMARY KEY(request_id, position));"
      "CREATE TABLE IF NOT EXISTS llm_request_vote ("
      " request_id TEXT NOT NULL REFERENCES llm_request(id) ON DELETE CASCADE,"
      " position SMALLINT NOT NULL CHECK(position BETWEEN 0 AND 31),"
      " oracle BYTEA NOT NULL CHECK(length(oracle) = 32),"
      " result_hash BYTEA NOT NULL CHECK(length(result_hash) = 32),"
      " PRIMARY KEY(request_id, position),"
      " UNIQUE(request_id, oracle));"},
      // ListRequests order
      {2, "CREATE INDEX IF NOT EXISTS llm_request_created_idx ON llm_request(created_at_ms, id);"},
      // status filtered listing
      {3, "CREATE INDEX IF NOT EXISTS llm_request_status_idx ON llm_request(status, created_at_ms, id);"},
  };
  return kSchema;
}

} // namespace coolrouter::db::sql
