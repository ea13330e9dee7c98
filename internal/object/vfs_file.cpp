#include "vfs_file.hpp"

#include "internal/lock/content_lock.hpp"
#include "internal/schema/default_schema.hpp"
#include "internal/schema/values.hpp"
#include "internal/util/errors.hpp"

namespace aff4::object {

VfsFile::VfsFile(ObjectContext context, urn::Urn urn, std::string kind, Mode mode, util::Timestamp as_of)
    : Object(std::move(context), std::move(urn), std::move(kind), mode, as_of) {
}

void VfsFile::Write(std::string_view data) {
  RequireWritable();

  auto content = GetBytes(schema::attrs::kContent);
  content.append(data);
  offset_ = content.size();

  Set(schema::attrs::kContent, schema::values::Bytes(content));
  Set(schema::attrs::kSize, schema::values::Integer(static_cast<int64_t>(content.size())));
}

std::string VfsFile::Read(uint64_t length) {
  const auto content = GetBytes(schema::attrs::kContent);
  if (offset_ >= content.size()) return {};

  auto out = content.substr(offset_, length);
  offset_ += out.size();
  return out;
}

void VfsFile::Seek(uint64_t offset) {
  offset_ = offset;
}

uint64_t VfsFile::Size() const {
  return static_cast<uint64_t>(GetInteger(schema::attrs::kSize));
}

util::Timestamp VfsFile::ContentAge() const {
  return GetTimestamp(schema::attrs::kContentLast);
}

urn::Urn VfsFile::Update() {
  // The lock is written straight to the store, so closed handles may update.
  if (GetMode() == Mode::kRead) {
    throw util::InvalidState("handle for " + Urn().Value() + " is read-only");
  }

  const auto& coordinator = Context().content_lock;
  if (!coordinator) {
    throw util::InvalidState("no content lock coordinator configured for " + Urn().Value());
  }

  auto lock = coordinator->Update(Urn());
  Observe(schema::attrs::kContentLock, store::VersionedValue{.timestamp = lock.timestamp, .value = schema::values::UrnValue(lock.flow)});
  return lock.flow;
}

} // namespace aff4::object
