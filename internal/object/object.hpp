#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/schema/schema_registry.hpp"
#include "internal/store/attribute_store.hpp"
#include "internal/urn/urn.hpp"
#include "internal/util/time.hpp"

namespace aff4::lock {
class ContentLockCoordinator;
}

namespace aff4::object {

namespace v1 = aff4::store::v1;

enum class Mode : std::uint8_t {
  kRead = 0,
  kReadWrite,
  // No baseline is loaded; reads only see staged values and defaults.
  kWrite,
};

struct ObjectContext {
  store::AttributeStorePtr                store;
  schema::SchemaRegistryPtr               schema;
  std::shared_ptr<const util::TimeSource> clock;
  // Optional; files cannot Update() without it.
  std::shared_ptr<lock::ContentLockCoordinator> content_lock;
};

/*
  Object

  Handle over one URN. Holds the snapshot loaded at open time plus a
  buffer of staged attribute values.

    Open --Set()--> Dirty --Flush()--> Open --Close()--> Closed

  Get() resolves staged -> snapshot -> schema default. Flush() writes the
  staged buffer as one batch at the clock's current time and folds it into
  the snapshot. A handle is not shareable across threads.
*/
class Object {
 public:
  Object(ObjectContext context, urn::Urn urn, std::string kind, Mode mode, util::Timestamp as_of);
  virtual ~Object();

  Object(const Object&)            = delete;
  Object& operator=(const Object&) = delete;

  const urn::Urn& Urn() const {
    return urn_;
  }
  const std::string& Kind() const {
    return kind_;
  }
  Mode GetMode() const {
    return mode_;
  }
  // Clock time when this handle was created or opened.
  util::Timestamp OpenedAt() const {
    return opened_at_;
  }

  // Throws util::SchemaViolation for unknown attributes or bad values and
  // util::InvalidState on read-only or closed handles.
  void Set(const std::string& attribute, const v1::AttributeValue& value);

  std::optional<v1::AttributeValue> Get(const std::string& attribute) const;

  // Typed accessors return the zero value when nothing is set.
  std::string             GetString(const std::string& attribute) const;
  int64_t                 GetInteger(const std::string& attribute) const;
  util::Timestamp         GetTimestamp(const std::string& attribute) const;
  std::string             GetBytes(const std::string& attribute) const;
  std::optional<urn::Urn> GetUrn(const std::string& attribute) const;

  template <typename T>
  std::optional<T> GetMessage(const std::string& attribute) const {
    auto value = TypedGet(attribute, schema::ValueType::kMessage);
    if (!value) return std::nullopt;
    T message;
    UnpackInto(attribute, value->message_value(), message);
    return message;
  }

  // Elements of a sequence attribute; empty when unset.
  std::vector<v1::AttributeValue> GetSequence(const std::string& attribute) const;

  template <typename T>
  std::vector<T> GetMessageSequence(const std::string& attribute) const {
    std::vector<T> out;
    for (const auto& item : GetSequence(attribute)) {
      T message;
      UnpackInto(attribute, item.message_value(), message);
      out.push_back(std::move(message));
    }
    return out;
  }

  // When the value Get() returns was written: the clock's current time for
  // staged values, the stored version time otherwise. Empty for defaults.
  std::optional<util::Timestamp> AttributeAge(const std::string& attribute) const;

  // Snapshot values overlaid with staged ones.
  std::map<std::string, v1::AttributeValue> GetAll() const;

  // Every stored version, oldest first.
  std::vector<store::VersionedValue> GetHistory(const std::string& attribute) const;

  bool IsDirty() const {
    return !staged_.empty();
  }
  bool IsClosed() const {
    return closed_;
  }

  void Flush();
  void Close();

 protected:
  const ObjectContext& Context() const {
    return ctx_;
  }

  // Records a version written on this handle's behalf by another component.
  void Observe(const std::string& attribute, store::VersionedValue version);

  void RequireWritable() const;

 private:
  friend class ObjectFactory;

  void Load();

  std::optional<v1::AttributeValue> TypedGet(const std::string& attribute, schema::ValueType type) const;

  static void UnpackInto(const std::string& attribute, const google::protobuf::Any& any, google::protobuf::Message& message);

  // Adds derived attributes whose tracked attribute changes in `batch`.
  // Returns the derived attributes added to `batch`.
  std::set<std::string> AddDerived(store::AttributeBatch& batch, util::Timestamp timestamp) const;

  ObjectContext   ctx_;
  urn::Urn        urn_;
  std::string     kind_;
  Mode            mode_;
  util::Timestamp as_of_;
  util::Timestamp opened_at_;
  bool            closed_ = false;

  std::map<std::string, store::VersionedValue> snapshot_;
  store::AttributeBatch                        staged_;
};

} // namespace aff4::object
