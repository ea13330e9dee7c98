#include "sqlite_repository.hpp"

#include <algorithm>
#include <limits>
#include <set>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace aff4::db::sqlite {

using aff4::db::ErrorCode;
using aff4::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

// INTEGER columns are signed; "newest" bounds saturate at INT64_MAX.
static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    const auto max = static_cast<uint64_t>(std::numeric_limits<sqlite3_int64>::max());
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(std::min(v, max)));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(st, col)) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* b = sqlite3_column_blob(st, col);
    return b ? std::string(static_cast<const char*>(b), sqlite3_column_bytes(st, col)) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

/*
  Owns a prepared statement for one query; read paths throw on failure.
*/
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        const int rc = sqlite3_prepare_v2(db_, sql, -1, &st_, nullptr);
        if (rc != SQLITE_OK) throw RepositoryError(SqliteDB::Translate(db_, rc));
    }
    ~Statement() { sqlite3_finalize(st_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return st_; }

    // true on SQLITE_ROW, false on SQLITE_DONE
    bool Step() {
        const int rc = sqlite3_step(st_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw RepositoryError(SqliteDB::Translate(db_, rc));
    }

private:
    sqlite3*      db_;
    sqlite3_stmt* st_ = nullptr;
};

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::Bootstrap() {
    sql::RunMigrations(*db_, sql::AttributeStoreMigrations());
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

Result SqliteRepository::AppendRecords(Transaction& t, const std::vector<model::AttributeRecord>& records) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_RECORD, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& r : records) {
        BindText(st, 1, r.urn);
        BindText(st, 2, r.attribute);
        BindU64(st, 3, r.timestamp_us);
        BindBlob(st, 4, r.value);

        const int rc = sqlite3_step(st);
        if (rc != SQLITE_DONE) {
            auto result = SqliteDB::Translate(db, rc);
            sqlite3_finalize(st);
            if (result.code == ErrorCode::ConstraintViolation)
                result.code = ErrorCode::AlreadyExists;
            return result;
        }

        sqlite3_reset(st);
        sqlite3_clear_bindings(st);
    }

    sqlite3_finalize(st);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<model::AttributeRecord>
SqliteRepository::GetLatest(Transaction& t, const std::string& urn, const std::string& attribute, uint64_t as_of_us) {
    Statement st(TX(t).Handle(), sql::SELECT_LATEST);
    BindText(st.get(), 1, urn);
    BindText(st.get(), 2, attribute);
    BindU64(st.get(), 3, as_of_us);

    if (!st.Step()) return std::nullopt;

    model::AttributeRecord r;
    r.urn          = urn;
    r.attribute    = attribute;
    r.timestamp_us = ColU64(st.get(), 0);
    r.value        = ColBlob(st.get(), 1);
    return r;
}

std::vector<model::AttributeRecord>
SqliteRepository::GetHistory(Transaction& t, const std::string& urn, const std::string& attribute) {
    Statement st(TX(t).Handle(), sql::SELECT_HISTORY);
    BindText(st.get(), 1, urn);
    BindText(st.get(), 2, attribute);

    std::vector<model::AttributeRecord> out;
    while (st.Step()) {
        model::AttributeRecord r;
        r.urn          = urn;
        r.attribute    = attribute;
        r.timestamp_us = ColU64(st.get(), 0);
        r.value        = ColBlob(st.get(), 1);
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<model::AttributeRecord>
SqliteRepository::GetSnapshot(Transaction& t, const std::string& urn, uint64_t as_of_us) {
    Statement st(TX(t).Handle(), sql::SELECT_SNAPSHOT);
    BindText(st.get(), 1, urn);
    BindU64(st.get(), 2, as_of_us);

    std::vector<model::AttributeRecord> out;
    while (st.Step()) {
        model::AttributeRecord r;
        r.urn          = urn;
        r.attribute    = ColText(st.get(), 0);
        r.timestamp_us = ColU64(st.get(), 1);
        r.value        = ColBlob(st.get(), 2);
        out.push_back(std::move(r));
    }
    return out;
}

// ------------------------------------------------------------------
// Addressing
// ------------------------------------------------------------------

bool SqliteRepository::Exists(Transaction& t, const std::string& urn) {
    Statement st(TX(t).Handle(), sql::SELECT_EXISTS);
    BindText(st.get(), 1, urn);
    return st.Step();
}

std::vector<std::string> SqliteRepository::ListChildren(Transaction& t, const std::string& urn) {
    const auto prefix = urn.back() == '/' ? urn : urn + "/";

    // every key starting with "<urn>/" sorts below "<urn>0"
    auto upper = prefix;
    upper.back() = '/' + 1;

    Statement st(TX(t).Handle(), sql::SELECT_DESCENDANTS);
    BindText(st.get(), 1, prefix);
    BindText(st.get(), 2, upper);

    std::set<std::string> children;
    while (st.Step()) {
        const auto key = ColText(st.get(), 0);
        const auto end = key.find('/', prefix.size());
        auto child     = key.substr(0, end);
        if (child.size() == prefix.size()) continue;
        children.insert(std::move(child));
    }
    return {children.begin(), children.end()};
}

} // namespace aff4::db::sqlite
