#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "aff4/store/v1/paths.pb.h"
#include "urn.hpp"

namespace aff4::urn {

/*
  Pathspec -> Urn mapping for files mirrored from a client.

    aff4:/<client-id>/fs/<tag>/<path-1>/<path-2>/...

  <tag> comes from the last (outermost) interpretation layer of the chain,
  e.g. "tsk" for a TSK path inside an OS volume. Each <path-n> is the
  segment's raw path with its mount point removed when the mount point is
  a prefix of it. Path content is never escaped or collapsed; a path that
  begins with '/' provides its own separator.
*/

// Segments of a nested pathspec, outer device first.
std::vector<const aff4::store::v1::PathSpec*> FlattenPathspec(const aff4::store::v1::PathSpec& pathspec);

// Appends `child` at the innermost end of `pathspec`'s chain.
void AppendPathspec(aff4::store::v1::PathSpec& pathspec, const aff4::store::v1::PathSpec& child);

std::string_view PathTypePrefix(aff4::store::v1::PathSpec::PathType type);

std::string EffectivePath(const aff4::store::v1::PathSpec& segment);

Urn PathspecToUrn(const aff4::store::v1::PathSpec& pathspec, const std::string& client_id);

} // namespace aff4::urn
