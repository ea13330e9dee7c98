#include "object.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/schema/values.hpp"
#include "internal/util/errors.hpp"

namespace aff4::object {

using observability::IntField;
using observability::StringField;

Object::Object(ObjectContext context, urn::Urn urn, std::string kind, Mode mode, util::Timestamp as_of)
    : ctx_(std::move(context)), urn_(std::move(urn)), kind_(std::move(kind)), mode_(mode), as_of_(as_of) {
  if (!ctx_.store || !ctx_.schema || !ctx_.clock) {
    throw std::invalid_argument("object handle requires a store, a schema and a clock");
  }
  if (!ctx_.schema->HasKind(kind_)) {
    throw util::SchemaViolation("unknown object kind " + kind_);
  }
  opened_at_ = ctx_.clock->NowMicros();
}

Object::~Object() {
  if (closed_ || staged_.empty()) return;

  try {
    Close();
  } catch (const std::exception& e) {
    AFF4_LOG_ERROR("dropping unflushed attributes of handle", {StringField("urn", urn_.Value()), StringField("error", e.what()),
                                                                IntField("staged", static_cast<int64_t>(staged_.size()))});
  }
}

void Object::Load() {
  if (mode_ == Mode::kWrite) return;
  snapshot_ = ctx_.store->ReadSnapshot(urn_, as_of_);
}

void Object::RequireWritable() const {
  if (closed_) {
    throw util::InvalidState("handle for " + urn_.Value() + " is closed");
  }
  if (mode_ == Mode::kRead) {
    throw util::InvalidState("handle for " + urn_.Value() + " is read-only");
  }
}

void Object::Set(const std::string& attribute, const v1::AttributeValue& value) {
  RequireWritable();

  const auto& descriptor = ctx_.schema->Lookup(kind_, attribute);
  schema::SchemaRegistry::Validate(descriptor, value);

  staged_[attribute] = value;
}

std::optional<v1::AttributeValue> Object::Get(const std::string& attribute) const {
  const auto& descriptor = ctx_.schema->Lookup(kind_, attribute);

  if (auto it = staged_.find(attribute); it != staged_.end()) {
    return it->second;
  }
  if (auto it = snapshot_.find(attribute); it != snapshot_.end()) {
    return it->second.value;
  }
  return descriptor.default_value;
}

std::optional<v1::AttributeValue> Object::TypedGet(const std::string& attribute, schema::ValueType type) const {
  const auto& descriptor = ctx_.schema->Lookup(kind_, attribute);
  if (descriptor.type != type || descriptor.multiplicity != schema::Multiplicity::kSingle) {
    throw util::SchemaViolation(attribute + " is not a single " + std::string(schema::ToString(type)) + " attribute");
  }
  return Get(attribute);
}

void Object::UnpackInto(const std::string& attribute, const google::protobuf::Any& any, google::protobuf::Message& message) {
  if (!any.UnpackTo(&message)) {
    throw util::SchemaViolation(attribute + " does not hold a " + message.GetTypeName());
  }
}

std::string Object::GetString(const std::string& attribute) const {
  auto value = TypedGet(attribute, schema::ValueType::kString);
  return value ? value->string_value() : std::string();
}

int64_t Object::GetInteger(const std::string& attribute) const {
  auto value = TypedGet(attribute, schema::ValueType::kInteger);
  return value ? value->integer_value() : 0;
}

util::Timestamp Object::GetTimestamp(const std::string& attribute) const {
  auto value = TypedGet(attribute, schema::ValueType::kTimestamp);
  return value ? value->timestamp_value() : 0;
}

std::string Object::GetBytes(const std::string& attribute) const {
  auto value = TypedGet(attribute, schema::ValueType::kBytes);
  return value ? value->bytes_value() : std::string();
}

std::optional<urn::Urn> Object::GetUrn(const std::string& attribute) const {
  auto value = TypedGet(attribute, schema::ValueType::kUrn);
  if (!value || value->urn_value().empty()) return std::nullopt;
  return urn::Urn(value->urn_value());
}

std::vector<v1::AttributeValue> Object::GetSequence(const std::string& attribute) const {
  const auto& descriptor = ctx_.schema->Lookup(kind_, attribute);
  if (descriptor.multiplicity != schema::Multiplicity::kSequence) {
    throw util::SchemaViolation(attribute + " is not a sequence attribute");
  }

  auto value = Get(attribute);
  if (!value) return {};
  return {value->list_value().items().begin(), value->list_value().items().end()};
}

std::optional<util::Timestamp> Object::AttributeAge(const std::string& attribute) const {
  if (staged_.contains(attribute)) return ctx_.clock->NowMicros();

  auto it = snapshot_.find(attribute);
  if (it == snapshot_.end()) return std::nullopt;
  return it->second.timestamp;
}

std::map<std::string, v1::AttributeValue> Object::GetAll() const {
  std::map<std::string, v1::AttributeValue> out;
  for (const auto& [attribute, version] : snapshot_) {
    out[attribute] = version.value;
  }
  for (const auto& [attribute, value] : staged_) {
    out[attribute] = value;
  }
  return out;
}

std::vector<store::VersionedValue> Object::GetHistory(const std::string& attribute) const {
  ctx_.schema->Lookup(kind_, attribute);
  return ctx_.store->ReadAll(urn_, attribute);
}

std::set<std::string> Object::AddDerived(store::AttributeBatch& batch, util::Timestamp timestamp) const {
  std::set<std::string> added;
  for (const auto& [attribute, value] : staged_) {
    for (const auto* derived : ctx_.schema->DerivedFrom(kind_, attribute)) {
      if (staged_.contains(derived->name)) continue;

      // Compare against what is persisted now, not the possibly stale snapshot.
      auto previous = ctx_.store->Read(urn_, attribute);
      if (previous && schema::values::Equals(previous->value, value)) continue;

      batch[derived->name] = schema::values::Timestamp(timestamp);
      added.insert(derived->name);
    }
  }
  return added;
}

void Object::Flush() {
  if (staged_.empty()) return;
  RequireWritable();

  const auto now = ctx_.clock->NowMicros();

  store::AttributeBatch batch   = staged_;
  const auto            derived = AddDerived(batch, now);

  // Derived markers carry the timestamp the batch actually lands at.
  const auto committed = ctx_.store->Write(urn_, batch, now, derived);
  for (const auto& name : derived) {
    batch[name] = schema::values::Timestamp(committed);
  }

  for (auto& [attribute, value] : batch) {
    snapshot_[attribute] = store::VersionedValue{.timestamp = committed, .value = std::move(value)};
  }
  staged_.clear();

  AFF4_LOG_DEBUG("handle flushed", {StringField("urn", urn_.Value()), IntField("attributes", static_cast<int64_t>(batch.size()))});
}

void Object::Close() {
  if (closed_) return;
  Flush();
  closed_ = true;
}

void Object::Observe(const std::string& attribute, store::VersionedValue version) {
  auto it = snapshot_.find(attribute);
  if (it != snapshot_.end() && it->second.timestamp > version.timestamp) return;
  snapshot_[attribute] = std::move(version);
}

} // namespace aff4::object
