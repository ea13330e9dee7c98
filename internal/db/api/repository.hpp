#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/attribute_record.hpp"

namespace aff4::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Records are append-only: (urn, attribute, timestamp) is unique and a
    stored record is never modified
  - Records appended in one transaction become visible together

  Write paths report failures as Result; read paths throw RepositoryError.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Attribute records
  // ---------------------------------------------------------------------

  virtual Result AppendRecords(Transaction&, const std::vector<model::AttributeRecord>& records) = 0;

  // Newest record with timestamp_us <= as_of_us.
  virtual std::optional<model::AttributeRecord> GetLatest(Transaction&, const std::string& urn, const std::string& attribute,
                                                          uint64_t as_of_us) = 0;

  // All records of one attribute, oldest first.
  virtual std::vector<model::AttributeRecord> GetHistory(Transaction&, const std::string& urn, const std::string& attribute) = 0;

  // Newest record <= as_of_us of every attribute of `urn`.
  virtual std::vector<model::AttributeRecord> GetSnapshot(Transaction&, const std::string& urn, uint64_t as_of_us) = 0;

  // ---------------------------------------------------------------------
  // Addressing
  // ---------------------------------------------------------------------

  virtual bool Exists(Transaction&, const std::string& urn) = 0;

  // Direct children of `urn` that have records themselves or below them.
  virtual std::vector<std::string> ListChildren(Transaction&, const std::string& urn) = 0;
};

} // namespace aff4::db
