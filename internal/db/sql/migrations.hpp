#pragma once

#include <string>
#include <vector>

namespace aff4::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

// Schema of the attribute store, in the order it must be applied.
const std::vector<std::string>& AttributeStoreMigrations();

/*
  Runs migrations in order. Every statement is idempotent
  (CREATE ... IF NOT EXISTS) so running them again is harmless.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace aff4::db::sql
