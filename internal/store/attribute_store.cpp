#include "attribute_store.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace aff4::store {

// Read paths roll their transaction back; only Write() commits.

namespace {

using observability::StringField;
using observability::UintField;

[[noreturn]] void ThrowDbError(const db::Result& result, const std::string& context) {
  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      AFF4_LOG_WARN("attribute store backend failure", {StringField("context", context), StringField("error", result.message)});
      throw util::StoreUnavailable(message);
  }
}

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }
  ThrowDbError(result, context);
}

} // namespace

AttributeStore::AttributeStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("AttributeStore requires a repository");
  }
}

VersionedValue AttributeStore::Decode(const db::model::AttributeRecord& record) {
  VersionedValue out;
  out.timestamp = record.timestamp_us;
  if (!out.value.ParseFromString(record.value)) {
    throw util::StoreUnavailable("corrupt value for " + record.urn + " " + record.attribute + "@" + std::to_string(record.timestamp_us));
  }
  return out;
}

util::Timestamp AttributeStore::Write(const urn::Urn& urn, const AttributeBatch& batch, util::Timestamp timestamp,
                                      const std::set<std::string>& commit_stamped) {
  if (batch.empty()) {
    return timestamp;
  }

  const auto context = "write " + urn.Value();
  try {
    auto tx = repository_->Begin();

    // keep per-attribute timestamps strictly increasing
    auto effective = timestamp;
    for (const auto& [attribute, _] : batch) {
      auto latest = repository_->GetLatest(*tx, urn.Value(), attribute, kNewest);
      if (latest && latest->timestamp_us >= effective) {
        effective = latest->timestamp_us + 1;
      }
    }

    std::vector<db::model::AttributeRecord> records;
    records.reserve(batch.size());
    for (const auto& [attribute, value] : batch) {
      db::model::AttributeRecord record;
      record.urn          = urn.Value();
      record.attribute    = attribute;
      record.timestamp_us = effective;
      bool serialized     = false;
      if (commit_stamped.contains(attribute)) {
        v1::AttributeValue stamped;
        stamped.set_timestamp_value(effective);
        serialized = stamped.SerializeToString(&record.value);
      } else {
        serialized = value.SerializeToString(&record.value);
      }
      if (!serialized) {
        throw std::runtime_error("failed to serialize " + attribute);
      }
      records.push_back(std::move(record));
    }

    ThrowIfDbError(repository_->AppendRecords(*tx, records), context);
    tx->Commit();

    AFF4_LOG_DEBUG("attribute batch committed",
                   {StringField("urn", urn.Value()), UintField("attributes", batch.size()), UintField("timestamp_us", effective)});
    return effective;
  } catch (const db::RepositoryError& e) {
    ThrowDbError(e.result(), context);
  }
}

std::optional<VersionedValue> AttributeStore::Read(const urn::Urn& urn, const std::string& attribute, util::Timestamp as_of) {
  try {
    auto tx     = repository_->Begin();
    auto record = repository_->GetLatest(*tx, urn.Value(), attribute, as_of);
    tx->Rollback();
    if (!record) return std::nullopt;
    return Decode(*record);
  } catch (const db::RepositoryError& e) {
    ThrowDbError(e.result(), "read " + urn.Value() + " " + attribute);
  }
}

std::vector<VersionedValue> AttributeStore::ReadAll(const urn::Urn& urn, const std::string& attribute) {
  try {
    auto tx      = repository_->Begin();
    auto records = repository_->GetHistory(*tx, urn.Value(), attribute);
    tx->Rollback();

    std::vector<VersionedValue> out;
    out.reserve(records.size());
    for (const auto& record : records) {
      out.push_back(Decode(record));
    }
    return out;
  } catch (const db::RepositoryError& e) {
    ThrowDbError(e.result(), "read history " + urn.Value() + " " + attribute);
  }
}

std::map<std::string, VersionedValue> AttributeStore::ReadSnapshot(const urn::Urn& urn, util::Timestamp as_of) {
  try {
    auto tx      = repository_->Begin();
    auto records = repository_->GetSnapshot(*tx, urn.Value(), as_of);
    tx->Rollback();

    std::map<std::string, VersionedValue> out;
    for (const auto& record : records) {
      out.emplace(record.attribute, Decode(record));
    }
    return out;
  } catch (const db::RepositoryError& e) {
    ThrowDbError(e.result(), "read snapshot " + urn.Value());
  }
}

bool AttributeStore::Exists(const urn::Urn& urn) {
  try {
    auto tx     = repository_->Begin();
    bool exists = repository_->Exists(*tx, urn.Value());
    tx->Rollback();
    return exists;
  } catch (const db::RepositoryError& e) {
    ThrowDbError(e.result(), "exists " + urn.Value());
  }
}

std::vector<urn::Urn> AttributeStore::ListChildren(const urn::Urn& urn) {
  try {
    auto tx       = repository_->Begin();
    auto children = repository_->ListChildren(*tx, urn.Value());
    tx->Rollback();

    std::vector<urn::Urn> out;
    out.reserve(children.size());
    for (const auto& child : children) {
      out.emplace_back(child);
    }
    return out;
  } catch (const db::RepositoryError& e) {
    ThrowDbError(e.result(), "list " + urn.Value());
  }
}

} // namespace aff4::store
