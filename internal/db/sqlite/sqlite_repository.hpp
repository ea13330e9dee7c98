#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace aff4::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Applies the attribute store schema.
  void Bootstrap();

  std::unique_ptr<Transaction> Begin() override;

  Result AppendRecords(Transaction&, const std::vector<model::AttributeRecord>& records) override;
  std::optional<model::AttributeRecord> GetLatest(Transaction&, const std::string& urn, const std::string& attribute,
                                                  uint64_t as_of_us) override;
  std::vector<model::AttributeRecord> GetHistory(Transaction&, const std::string& urn, const std::string& attribute) override;
  std::vector<model::AttributeRecord> GetSnapshot(Transaction&, const std::string& urn, uint64_t as_of_us) override;

  bool Exists(Transaction&, const std::string& urn) override;
  std::vector<std::string> ListChildren(Transaction&, const std::string& urn) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
};

}
