#pragma once

#include <string>
#include <vector>

namespace coolrouter::db::sql {

struct Migration {
  int         version = 0;
  std::string sql;
};

/*
  Backend hook for schema migrations. Each backend records the applied
  schema version next to the data (sqlite: PRAGMA user_version,
  postgres: coolrouter_schema table).
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  // 0 for an empty database.
  virtual int SchemaVersion() = 0;

  // Runs migration.sql and records migration.version in one transaction.
  virtual void Apply(const Migration& migration) = 0;
};

/*
  Applies, in order, every migration newer than the stored schema version
  and returns the resulting version. A database written by a newer build
  (stored version above the last known migration) is refused.
*/

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

// Request schema, with CHECK constraints mirroring model/limits.hpp.
const std::vector<Migration>& SqliteSchema();
const std::vector<Migration>& PostgresSchema();

} // namespace coolrouter::db::sql
