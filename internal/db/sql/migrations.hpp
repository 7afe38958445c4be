#pragma once

#include <string>
#include <vector>

namespace redrive::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order.
  Statements are idempotent (CREATE ... IF NOT EXISTS).
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Schema for each relational backend.
const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace redrive::db::sql
