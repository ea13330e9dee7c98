#include "object_factory.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/schema/default_schema.hpp"
#include "internal/schema/values.hpp"
#include "internal/util/errors.hpp"
#include "vfs_file.hpp"
#include "vfs_grr_client.hpp"

namespace aff4::object {

using observability::StringField;

ObjectFactory::ObjectFactory(ObjectContext context) : ctx_(std::move(context)) {
  if (!ctx_.store || !ctx_.schema || !ctx_.clock) {
    throw std::invalid_argument("ObjectFactory requires a store, a schema and a clock");
  }
}

std::unique_ptr<Object> ObjectFactory::Instantiate(const urn::Urn& urn, const std::string& kind, Mode mode, util::Timestamp as_of) {
  if (ctx_.schema->IsA(kind, schema::kinds::kFile)) {
    return std::make_unique<VfsFile>(ctx_, urn, kind, mode, as_of);
  }
  if (ctx_.schema->IsA(kind, schema::kinds::kClient)) {
    return std::make_unique<VfsGrrClient>(ctx_, urn, kind, mode, as_of);
  }
  return std::make_unique<Object>(ctx_, urn, kind, mode, as_of);
}

void ObjectFactory::RequireKind(const Object& handle, const std::string& kind) const {
  if (!ctx_.schema->IsA(handle.Kind(), kind)) {
    throw util::SchemaViolation(handle.Urn().Value() + " is a " + handle.Kind() + ", not a " + kind);
  }
}

std::unique_ptr<Object> ObjectFactory::Create(const urn::Urn& urn, const std::string& kind, Mode mode) {
  if (mode == Mode::kRead) {
    throw util::InvalidState("cannot create " + urn.Value() + " read-only");
  }
  if (!ctx_.schema->HasKind(kind)) {
    throw util::SchemaViolation("unknown object kind " + kind);
  }

  auto handle = Instantiate(urn, kind, mode, store::kNewest);
  handle->Set(schema::attrs::kType, schema::values::String(kind));

  AFF4_LOG_DEBUG("object created", {StringField("urn", urn.Value()), StringField("kind", kind)});
  return handle;
}

std::unique_ptr<Object> ObjectFactory::Open(const urn::Urn& urn, Mode mode, util::Timestamp as_of) {
  if (!ctx_.store->Exists(urn)) {
    throw util::NotFound("no object at " + urn.Value());
  }

  std::string kind = schema::kinds::kObject;
  if (auto type = ctx_.store->Read(urn, schema::attrs::kType)) {
    kind = type->value.string_value();
  }
  if (!ctx_.schema->HasKind(kind)) {
    AFF4_LOG_WARN("object has unregistered kind; opening as base object", {StringField("urn", urn.Value()), StringField("kind", kind)});
    kind = schema::kinds::kObject;
  }

  auto handle = Instantiate(urn, kind, mode, as_of);
  handle->Load();
  return handle;
}

bool ObjectFactory::Exists(const urn::Urn& urn) {
  return ctx_.store->Exists(urn);
}

std::vector<urn::Urn> ObjectFactory::ListChildren(const urn::Urn& urn) {
  return ctx_.store->ListChildren(urn);
}

} // namespace aff4::object
