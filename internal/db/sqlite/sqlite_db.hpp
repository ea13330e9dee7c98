#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/sql/migrations.hpp"

namespace aff4::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Failures throw RepositoryError carrying the translated ErrorCode.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(bool wal_mode);

  static Result Translate(sqlite3* db, int rc);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace aff4::db::sqlite
