#include "pg_migrations.hpp"

namespace coolrouter::db::postgres {

namespace {

constexpr const char* kCreateSchemaTable = "CREATE TABLE IF NOT EXISTS coolrouter_schema (version INTEGER NOT NULL)";

} // namespace

PgMigrationExecutor::PgMigrationExecutor(std::string conninfo) : conn_(conninfo) {
}

int PgMigrationExecutor::SchemaVersion() {
  pqxx::work tx(conn_);
  tx.exec(kCreateSchemaTable);
  const auto rows = tx.exec("SELECT COALESCE(MAX(version), 0) FROM coolrouter_schema");
  const int  version = rows[0][0].as<int>();
  tx.commit();
  return version;
}

void PgMigrationExecutor::Apply(const sql::Migration& migration) {
  pqxx::work tx(conn_);
  tx.exec(migration.sql);
  tx.exec("INSERT INTO coolrouter_schema(version) VALUES (" + std::to_string(migration.version) + ")");
  tx.commit();
}

} // namespace coolrouter::db::postgres
