#include "factory.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/auth/authenticator.hpp"
#include "internal/consumer/llm_consumer.hpp"
#include "internal/core/request_broker.hpp"
#include "internal/crypto/sha256.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/dispatch/callback_dispatcher.hpp"
#include "internal/dispatch/program_registry.hpp"
#include "internal/events/event_hub.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/hex.hpp"
#if COOLROUTER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if COOLROUTER_DB_POSTGRES
#include "internal/db/postgres/pg_migrations.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace coolrouter::factory {

using namespace coolrouter;

namespace {

constexpr const char*   kDefaultConsumerSeed = "coolrouter:llm_consumer";
constexpr std::uint32_t kDefaultQueueDepth   = 1024;


model::Identity ConsumerProgramId(const coolrouter::runtime::config::ConsumerConfig& config) {
  if (config.program_id().empty()) {
    return crypto::Sha256(kDefaultConsumerSeed);
  }
  return util::FixedFromHex<model::kIdentityBytes>(config.program_id(), "consumer.program_id");
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const coolrouter::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if COOLROUTER_DB_SQLITE
    const auto busy_timeout_ms = database.sqlite().busy_timeout_ms() == 0 ? db::sqlite::SqliteDB::kDefaultBusyTimeoutMs
                                                                           : static_cast<int>(database.sqlite().busy_timeout_ms());
    auto       sqlite_db       = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), busy_timeout_ms);
    const auto schema_version  = db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    COOLROUTER_LOG_INFO("Repository ready", {observability::StringField("backend", "sqlite"),
                                             observability::StringField("path", database.sqlite().path()),
                                             observability::IntField("schema_version", schema_version)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if COOLROUTER_DB_POSTGRES
    int schema_version = 0;
    {
      db::postgres::PgMigrationExecutor executor(database.postgres().connection_uri());
      schema_version = db::sql::RunMigrations(executor, db::sql::PostgresSchema());
    }
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(),
                                                       database.postgres().max_connections(),
                                                       std::chrono::milliseconds(database.postgres().acquire_timeout_ms()));
    COOLROUTER_LOG_INFO("Repository ready", {observability::StringField("backend", "postgres"),
                                             observability::IntField("schema_version", schema_version)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  COOLROUTER_LOG_INFO("Repository ready", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

Runtime BuildRuntime(const coolrouter::runtime::config::RuntimeConfig& config) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Storage and event fan-out
  // ------------------------------------------------------------------
  runtime.repository = BuildRepository(config);
  const auto queue_depth = config.events().subscriber_queue_depth();
  runtime.events         = std::make_shared<events::EventHub>(queue_depth == 0 ? kDefaultQueueDepth : queue_depth);

  // ------------------------------------------------------------------
  // Request lifecycle
  // ------------------------------------------------------------------
  runtime.registry   = std::make_shared<dispatch::ProgramRegistry>();
  auto dispatcher    = std::make_shared<dispatch::CallbackDispatcher>(runtime.registry);
  auto authenticator = std::make_shared<auth::Ed25519Authenticator>();

  runtime.broker = std::make_shared<core::RequestBroker>(runtime.repository, authenticator, dispatcher, runtime.events);

  // ------------------------------------------------------------------
  // Reference consumer program
  // ------------------------------------------------------------------
  if (config.consumer().enabled()) {
    consumer::LlmConsumer::Options options;
    options.program_id = ConsumerProgramId(config.consumer());
    if (!config.consumer().provider().empty()) {
      options.provider = config.consumer().provider();
    }
    if (!config.consumer().model_id().empty()) {
      options.model_id = config.consumer().model_id();
    }

    runtime.consumer = std::make_shared<consumer::LlmConsumer>(options, runtime.broker, authenticator, runtime.events);
    runtime.registry->Register(options.program_id, runtime.consumer);

    COOLROUTER_LOG_INFO("Consumer program registered", {observability::IdentityField("program_id", options.program_id)});
  }

  return runtime;
}

} // namespace coolrouter::factory
