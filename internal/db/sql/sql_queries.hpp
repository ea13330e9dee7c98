#pragma once

namespace aff4::db::sql {

/*
  Canonical SQL for the attribute store.
*/

static constexpr const char* INSERT_RECORD =
    "INSERT INTO attribute_records(urn,attribute,timestamp_us,value)"
    " VALUES(?,?,?,?);";

static constexpr const char* SELECT_LATEST =
    "SELECT timestamp_us,value FROM attribute_records"
    " WHERE urn=? AND attribute=? AND timestamp_us<=?"
    " ORDER BY timestamp_us DESC LIMIT 1;";

static constexpr const char* SELECT_HISTORY =
    "SELECT timestamp_us,value FROM attribute_records"
    " WHERE urn=? AND attribute=?"
    " ORDER BY timestamp_us ASC;";

static constexpr const char* SELECT_SNAPSHOT =
    "SELECT r.attribute,r.timestamp_us,r.value FROM attribute_records r"
    " WHERE r.urn=?1 AND r.timestamp_us=("
    "   SELECT MAX(timestamp_us) FROM attribute_records"
    "   WHERE urn=r.urn AND attribute=r.attribute AND timestamp_us<=?2)"
    " ORDER BY r.attribute;";

static constexpr const char* SELECT_EXISTS =
    "SELECT 1 FROM attribute_records WHERE urn=? LIMIT 1;";

static constexpr const char* SELECT_DESCENDANTS =
    "SELECT DISTINCT urn FROM attribute_records"
    " WHERE urn>=?1 AND urn<?2 ORDER BY urn;";

} // namespace aff4::db::sql
