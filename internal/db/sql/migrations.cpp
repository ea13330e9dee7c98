#include "internal/db/sql/migrations.hpp"

namespace aff4::db::sql {

const std::vector<std::string>& AttributeStoreMigrations() {
  static const std::vector<std::string> kMigrations = {
      "CREATE TABLE IF NOT EXISTS attribute_records ("
      " urn TEXT NOT NULL,"
      " attribute TEXT NOT NULL,"
      " timestamp_us INTEGER NOT NULL,"
      " value BLOB NOT NULL,"
      " PRIMARY KEY (urn, attribute, timestamp_us));",
      "CREATE INDEX IF NOT EXISTS attribute_records_by_urn ON attribute_records(urn);",
  };
  return kMigrations;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

} // namespace aff4::db::sql
