#pragma once

#include <string>
#include <vector>

namespace coord::db::sql {

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
  Runs migrations in order. Every statement must be idempotent
  (CREATE ... IF NOT EXISTS) so bootstrapping an existing store is a no-op.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Schema of the coordination store, in apply order.
const std::vector<std::string>& CoordinationSchema();

} // namespace coord::db::sql
