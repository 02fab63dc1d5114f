#pragma once

#include <string>
#include <vector>

namespace dispatch::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

enum class Dialect {
  kSqlite,
  kPostgres,
};

// Idempotent CREATE ... IF NOT EXISTS statements, in dependency order.
std::vector<std::string> SchemaStatements(Dialect dialect);

/*
  Runs migrations in order.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace dispatch::db::sql
