#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace aff4::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;

  // destructors must not throw; report and leave the connection to sqlite
  const int rc = sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    AFF4_LOG_WARN("sqlite rollback failed", {observability::StringField("error", sqlite3_errmsg(db_->Handle())),
                                             observability::StringField("path", db_->Path())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
}

} // namespace aff4::db::sqlite
