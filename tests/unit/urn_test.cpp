#include "internal/urn/urn.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace {

using aff4::urn::Urn;

template <typename Fn>
bool ThrowsInvalidUrn(Fn&& fn) {
  try {
    fn();
  } catch (const aff4::util::InvalidUrn&) {
    return true;
  }
  return false;
}

void TestRelativeFormsAreAnchoredUnderRoot() {
  assert(Urn("C.1234/fs/os").Value() == "aff4:/C.1234/fs/os");
  assert(Urn("/C.1234/fs/os").Value() == "aff4:/C.1234/fs/os");
  assert(Urn("aff4:/C.1234/fs/os").Value() == "aff4:/C.1234/fs/os");
  assert(Urn().Value() == "aff4:/");
  assert(Urn().IsRoot());
}

void TestMalformedInputIsRejected() {
  assert(ThrowsInvalidUrn([] { Urn(""); }));
  assert(ThrowsInvalidUrn([] { Urn("aff4:"); }));
  assert(ThrowsInvalidUrn([] { Urn("aff4:C.1234"); }));
  assert(ThrowsInvalidUrn([] { Urn("http://example.com/x"); }));
  assert(ThrowsInvalidUrn([] { Urn(std::string("C.1\0/x", 6)); }));

  assert(!Urn::IsValid(""));
  assert(Urn::IsValid("C.1234"));
}

void TestDriveLettersAreNotSchemes() {
  const Urn urn("c:/windows");
  assert(urn.Value() == "aff4:/c:/windows");
}

void TestAddKeepsComponentBytes() {
  const auto urn = Urn("C.1234").Add("fs").Add("tsk").Add(R"(\\.\Volume{1234}\)").Add("Test Directory/notes.txt:ads");
  assert(urn.Value() == R"(aff4:/C.1234/fs/tsk/\\.\Volume{1234}\/Test Directory/notes.txt:ads)");

  assert(Urn().Add("C.1234").Value() == "aff4:/C.1234");
}

void TestNavigation() {
  const Urn urn("aff4:/C.1234/fs/os/etc/passwd");

  assert(urn.RootId() == "C.1234");
  assert(urn.Basename() == "passwd");
  assert(urn.Dirname().Value() == "aff4:/C.1234/fs/os/etc");
  assert(Urn("C.1234").Dirname().IsRoot());
  assert(Urn().RootId().empty());

  assert(urn.IsChildOf(Urn("C.1234/fs")));
  assert(urn.IsChildOf(Urn()));
  assert(!Urn("C.12345").IsChildOf(Urn("C.1234")));
  assert(!urn.IsChildOf(urn));

  assert(urn.RelativeName(Urn("C.1234/fs")) == "os/etc/passwd");
  assert(ThrowsInvalidUrn([&] { urn.RelativeName(Urn("C.9999")); }));
}

void TestHashingAndOrdering() {
  std::unordered_set<Urn> seen;
  seen.insert(Urn("C.1"));
  seen.insert(Urn("/C.1"));
  seen.insert(Urn("C.2"));
  assert(seen.size() == 2);

  assert(Urn("C.1") < Urn("C.2"));
  assert(Urn("C.1") != Urn("C.2"));
}

} // namespace

int main() {
  TestRelativeFormsAreAnchoredUnderRoot();
  TestMalformedInputIsRejected();
  TestDriveLettersAreNotSchemes();
  TestAddKeepsComponentBytes();
  TestNavigation();
  TestHashingAndOrdering();

  std::cout << "aff4_store_unit_urn: pass\n";
  return 0;
}
