#include "pathspec_mapper.hpp"

#include "internal/util/errors.hpp"

namespace aff4::urn {

using aff4::store::v1::PathSpec;

std::vector<const PathSpec*> FlattenPathspec(const PathSpec& pathspec) {
  std::vector<const PathSpec*> chain;
  for (const PathSpec* segment = &pathspec; segment != nullptr;
       segment = segment->has_nested_path() ? &segment->nested_path() : nullptr) {
    chain.push_back(segment);
  }
  return chain;
}

void AppendPathspec(PathSpec& pathspec, const PathSpec& child) {
  PathSpec* tail = &pathspec;
  while (tail->has_nested_path()) {
    tail = tail->mutable_nested_path();
  }
  *tail->mutable_nested_path() = child;
}

std::string_view PathTypePrefix(PathSpec::PathType type) {
  switch (type) {
    case PathSpec::OS:
      return "os";
    case PathSpec::TSK:
      return "tsk";
    case PathSpec::REGISTRY:
      return "registry";
    case PathSpec::MEMORY:
      return "memory";
    case PathSpec::TMPFILE:
      return "temp";
    default:
      throw util::InvalidUrn("pathspec has no interpretation type");
  }
}

std::string EffectivePath(const PathSpec& segment) {
  const auto& path        = segment.path();
  const auto& mount_point = segment.mount_point();

  if (!mount_point.empty() && path.compare(0, mount_point.size(), mount_point) == 0) {
    return path.substr(mount_point.size());
  }
  return path;
}

Urn PathspecToUrn(const PathSpec& pathspec, const std::string& client_id) {
  if (client_id.empty() || client_id.find('/') != std::string::npos) {
    throw util::InvalidUrn("invalid client id: '" + client_id + "'");
  }

  const auto chain = FlattenPathspec(pathspec);

  std::string value(Urn::kRoot);
  value.append(client_id);
  value.append("/fs/");
  value.append(PathTypePrefix(chain.back()->pathtype()));

  for (const auto* segment : chain) {
    const auto path = EffectivePath(*segment);
    if (path.empty() || path.front() != '/') value.push_back('/');
    value.append(path);
  }

  return Urn(value);
}

} // namespace aff4::urn
