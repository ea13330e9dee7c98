#include "sqlite_db.hpp"

namespace aff4::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    auto result = SqliteDB::Translate(db, rc);
    result.message = std::string(what) + ": " + result.message;
    throw RepositoryError(std::move(result));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw RepositoryError(Result::Err(ErrorCode::IOError, "sqlite open " + path_ + ": " + msg));
  }

  Configure(wal_mode);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

Result SqliteDB::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  const std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, msg);
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, msg);
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, msg);
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, msg);
    default:
      return Result::Err(ErrorCode::InternalError, msg);
  }
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    auto result    = Translate(db_, rc);
    result.message = msg;
    throw RepositoryError(std::move(result));
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL enables concurrent readers while writer holds lock
  if (wal_mode) Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

} // namespace aff4::db::sqlite
