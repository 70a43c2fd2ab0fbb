#pragma once

#include <pqxx/pqxx>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace coolrouter::db::postgres {

/*
  Runs migrations on a dedicated connection. The schema must exist
  before PgPool connects, since every pooled connection prepares its
  statements against the request tables.
*/
class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(std::string conninfo);

  int  SchemaVersion() override;
  void Apply(const sql::Migration& migration) override;

 private:
  pqxx::connection conn_;
};

} // namespace coolrouter::db::postgres
