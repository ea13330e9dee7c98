#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "internal/db/api/repository.hpp"

namespace aff4::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result AppendRecords(Transaction&, const std::vector<model::AttributeRecord>& records) override;
  std::optional<model::AttributeRecord> GetLatest(Transaction&, const std::string& urn, const std::string& attribute,
                                                  uint64_t as_of_us) override;
  std::vector<model::AttributeRecord> GetHistory(Transaction&, const std::string& urn, const std::string& attribute) override;
  std::vector<model::AttributeRecord> GetSnapshot(Transaction&, const std::string& urn, uint64_t as_of_us) override;

  bool Exists(Transaction&, const std::string& urn) override;
  std::vector<std::string> ListChildren(Transaction&, const std::string& urn) override;

private:
  friend class MemoryTransaction;

  // timestamp -> serialized value
  using Versions = std::map<uint64_t, std::string>;

  struct State {
    // urn -> attribute -> versions; ordered so children are a prefix range
    std::map<std::string, std::map<std::string, Versions>> objects;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
