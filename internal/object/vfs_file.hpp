#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "object.hpp"

namespace aff4::object {

/*
  VfsFile

  Stored image of a file from an endpoint. Content is one bytes attribute
  read and written through a cursor; every write keeps aff4:size in step.
  The schema derives aff4:content_last from aff4:content, so ContentAge()
  only moves when a flush really changed the bytes.
*/
class VfsFile : public Object {
 public:
  static constexpr const char* kKind = "VFSFile";

  VfsFile(ObjectContext context, urn::Urn urn, std::string kind, Mode mode, util::Timestamp as_of);

  // Appends to the content and leaves the cursor at the new end.
  void Write(std::string_view data);

  // Up to `length` bytes from the cursor; advances the cursor.
  std::string Read(uint64_t length);

  void     Seek(uint64_t offset);
  uint64_t Tell() const {
    return offset_;
  }

  uint64_t Size() const;

  // Time of the last flush that changed the content; 0 if never.
  util::Timestamp ContentAge() const;

  // Ensures a content collection flow is running for this file and returns
  // the flow holding the content lock.
  urn::Urn Update();

 private:
  uint64_t offset_ = 0;
};

} // namespace aff4::object
