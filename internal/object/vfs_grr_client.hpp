#pragma once

#include "aff4/store/v1/client.pb.h"
#include "aff4/store/v1/paths.pb.h"
#include "object.hpp"

namespace aff4::object {

// Endpoint root object, addressed as aff4:/<client-id>.
class VfsGrrClient : public Object {
 public:
  static constexpr const char* kKind = "VFSGRRClient";

  VfsGrrClient(ObjectContext context, urn::Urn urn, std::string kind, Mode mode, util::Timestamp as_of);

  v1::ClientSummary GetSummary() const;

  // Stored urn of the file a pathspec was collected into on this client.
  urn::Urn PathspecToUrn(const v1::PathSpec& pathspec) const;
};

} // namespace aff4::object
