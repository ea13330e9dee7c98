#include "internal/urn/pathspec_mapper.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using aff4::store::v1::PathSpec;
using aff4::urn::PathspecToUrn;

PathSpec Segment(PathSpec::PathType type, const std::string& path, const std::string& mount_point = "") {
  PathSpec segment;
  segment.set_pathtype(type);
  segment.set_path(path);
  if (!mount_point.empty()) segment.set_mount_point(mount_point);
  return segment;
}

PathSpec VolumeDevice() {
  return Segment(PathSpec::OS, R"(\\.\Volume{1234}\)", "/c:/");
}

void TestPrefixComesFromLastSegment() {
  auto pathspec = VolumeDevice();
  aff4::urn::AppendPathspec(pathspec, Segment(PathSpec::TSK, "/windows"));

  const auto urn = PathspecToUrn(pathspec, "C.1234567812345678");
  assert(urn.Value() == R"(aff4:/C.1234567812345678/fs/tsk/\\.\Volume{1234}\/windows)");
}

void TestAlternateDataStreamIsKept() {
  auto stream = Segment(PathSpec::TSK, "/Test Directory/notes.txt:ads");
  stream.set_inode(66);
  stream.set_ntfs_type(128);
  stream.set_ntfs_id(2);

  auto pathspec = VolumeDevice();
  aff4::urn::AppendPathspec(pathspec, stream);

  const auto urn = PathspecToUrn(pathspec, "C.1234567812345678");
  assert(urn.Value() == R"(aff4:/C.1234567812345678/fs/tsk/\\.\Volume{1234}\/Test Directory/notes.txt:ads)");
}

void TestSingleOsSegment() {
  const auto urn = PathspecToUrn(Segment(PathSpec::OS, "/etc/passwd"), "C.1");
  assert(urn.Value() == "aff4:/C.1/fs/os/etc/passwd");

  // A relative path gets a separator of its own.
  assert(PathspecToUrn(Segment(PathSpec::OS, "etc/passwd"), "C.1") == urn);
}

void TestMountPointIsStrippedOnlyAsPrefix() {
  assert(aff4::urn::EffectivePath(Segment(PathSpec::OS, "/mnt/data/file", "/mnt/data")) == "/file");
  assert(aff4::urn::EffectivePath(Segment(PathSpec::OS, "/other/file", "/mnt/data")) == "/other/file");
}

void TestMountPointEqualToPathLeavesEmptySegment() {
  auto pathspec = Segment(PathSpec::OS, "/c:/", "/c:/");
  aff4::urn::AppendPathspec(pathspec, Segment(PathSpec::TSK, "/windows"));

  assert(aff4::urn::EffectivePath(pathspec).empty());
  assert(PathspecToUrn(pathspec, "C.1").Value() == "aff4:/C.1/fs/tsk//windows");
}

void TestMappingIsStable() {
  auto pathspec = VolumeDevice();
  aff4::urn::AppendPathspec(pathspec, Segment(PathSpec::TSK, "/Test Directory/notes.txt:ads"));

  const auto first  = PathspecToUrn(pathspec, "C.1234567812345678");
  const auto second = PathspecToUrn(pathspec, "C.1234567812345678");
  assert(first.Value() == second.Value());

  PathSpec copy = pathspec;
  assert(PathspecToUrn(copy, "C.1234567812345678").Value() == first.Value());
}

void TestPrefixes() {
  assert(aff4::urn::PathTypePrefix(PathSpec::OS) == "os");
  assert(aff4::urn::PathTypePrefix(PathSpec::TSK) == "tsk");
  assert(aff4::urn::PathTypePrefix(PathSpec::REGISTRY) == "registry");
  assert(aff4::urn::PathTypePrefix(PathSpec::MEMORY) == "memory");
  assert(aff4::urn::PathTypePrefix(PathSpec::TMPFILE) == "temp");

  const auto urn = PathspecToUrn(Segment(PathSpec::REGISTRY, "/HKEY_LOCAL_MACHINE/SOFTWARE"), "C.1");
  assert(urn.Value() == "aff4:/C.1/fs/registry/HKEY_LOCAL_MACHINE/SOFTWARE");
}

void TestInvalidInputs() {
  bool threw = false;
  try {
    PathspecToUrn(Segment(PathSpec::UNSET, "/x"), "C.1");
  } catch (const aff4::util::InvalidUrn&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    PathspecToUrn(Segment(PathSpec::OS, "/x"), "C.1/evil");
  } catch (const aff4::util::InvalidUrn&) {
    threw = true;
  }
  assert(threw);
}

void TestFlattenOrder() {
  auto pathspec = VolumeDevice();
  aff4::urn::AppendPathspec(pathspec, Segment(PathSpec::TSK, "/a"));
  aff4::urn::AppendPathspec(pathspec, Segment(PathSpec::TSK, "/b"));

  const auto chain = aff4::urn::FlattenPathspec(pathspec);
  assert(chain.size() == 3);
  assert(chain[0]->pathtype() == PathSpec::OS);
  assert(chain[2]->path() == "/b");
}

} // namespace

int main() {
  TestPrefixComesFromLastSegment();
  TestAlternateDataStreamIsKept();
  TestSingleOsSegment();
  TestMountPointIsStrippedOnlyAsPrefix();
  TestMountPointEqualToPathLeavesEmptySegment();
  TestMappingIsStable();
  TestPrefixes();
  TestInvalidInputs();
  TestFlattenOrder();

  std::cout << "aff4_store_unit_pathspec_mapper: pass\n";
  return 0;
}
