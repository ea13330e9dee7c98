#include "vfs_grr_client.hpp"

#include "client_summary.hpp"
#include "internal/urn/pathspec_mapper.hpp"
#include "internal/util/errors.hpp"

namespace aff4::object {

VfsGrrClient::VfsGrrClient(ObjectContext context, urn::Urn urn, std::string kind, Mode mode, util::Timestamp as_of)
    : Object(std::move(context), std::move(urn), std::move(kind), mode, as_of) {
  if (Urn().RootId().empty() || Urn() != urn::Urn(Urn().RootId())) {
    throw util::InvalidUrn("client objects live directly below the root: " + Urn().Value());
  }
}

v1::ClientSummary VfsGrrClient::GetSummary() const {
  return SummarizeClient(*this);
}

urn::Urn VfsGrrClient::PathspecToUrn(const v1::PathSpec& pathspec) const {
  return urn::PathspecToUrn(pathspec, Urn().RootId());
}

} // namespace aff4::object
