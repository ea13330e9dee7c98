#pragma once

#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "aff4/store/v1/value.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/urn/urn.hpp"
#include "internal/util/time.hpp"

namespace aff4::store {

inline constexpr util::Timestamp kNewest = std::numeric_limits<util::Timestamp>::max();

struct VersionedValue {
  util::Timestamp    timestamp = 0;
  v1::AttributeValue value;
};

// attribute name -> value; one entry per attribute by construction
using AttributeBatch = std::map<std::string, v1::AttributeValue>;

/*
  AttributeStore

  Versioned attribute storage on top of a db::Repository.

  - Write() commits a whole batch in one repository transaction at one
    timestamp, so readers see all of it or none of it.
  - Per (urn, attribute) timestamps strictly increase. A batch whose
    requested timestamp is not newer than an existing version of one of
    its attributes is stamped one microsecond after the newest of them.
  - Repository failures surface as util::StoreUnavailable. Nothing here
    retries.
*/
class AttributeStore {
 public:
  explicit AttributeStore(std::shared_ptr<db::Repository> repository);

  // Returns the timestamp the batch was committed at. Attributes named in
  // `commit_stamped` are stored as timestamp values equal to that commit
  // timestamp, whatever value the batch carries for them.
  util::Timestamp Write(const urn::Urn& urn, const AttributeBatch& batch, util::Timestamp timestamp,
                        const std::set<std::string>& commit_stamped = {});

  std::optional<VersionedValue> Read(const urn::Urn& urn, const std::string& attribute, util::Timestamp as_of = kNewest);

  // Oldest first.
  std::vector<VersionedValue> ReadAll(const urn::Urn& urn, const std::string& attribute);

  std::map<std::string, VersionedValue> ReadSnapshot(const urn::Urn& urn, util::Timestamp as_of = kNewest);

  bool Exists(const urn::Urn& urn);

  std::vector<urn::Urn> ListChildren(const urn::Urn& urn);

 private:
  static VersionedValue Decode(const db::model::AttributeRecord& record);

  std::shared_ptr<db::Repository> repository_;
};

using AttributeStorePtr = std::shared_ptr<AttributeStore>;

} // namespace aff4::store
