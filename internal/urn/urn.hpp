#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace aff4::urn {

/*
  Urn

  Canonical address of one versioned object: "aff4:/<root-id>/<path>".

  Only the separators this class inserts are structural. Components added
  through Add() are kept byte for byte, so they may carry forward slashes,
  backslashes, drive letters or ":stream" suffixes of the endpoint path.

  Accepted input forms:
    "aff4:/C.1234/fs/os"   as is
    "/C.1234/fs/os"        anchored under aff4:/
    "C.1234/fs/os"         anchored under aff4:/

  Anything else (empty string, embedded NUL, another scheme, "aff4:" not
  followed by '/') throws util::InvalidUrn.
*/
class Urn {
 public:
  static constexpr std::string_view kScheme = "aff4:";
  static constexpr std::string_view kRoot   = "aff4:/";

  Urn();
  Urn(const std::string& value);
  Urn(const char* value);

  // Appends one component after a '/' separator.
  Urn Add(std::string_view component) const;

  const std::string& Value() const {
    return value_;
  }

  // Everything after "aff4:".
  std::string_view Path() const;

  // Top-level component, normally the client id. Empty for the root.
  std::string RootId() const;

  std::string Basename() const;
  Urn         Dirname() const;

  bool IsRoot() const;
  bool IsChildOf(const Urn& parent) const;

  // Path of this urn below `parent`, without the leading separator.
  std::string RelativeName(const Urn& parent) const;

  static bool IsValid(std::string_view value);

  bool operator==(const Urn& other) const {
    return value_ == other.value_;
  }
  bool operator!=(const Urn& other) const {
    return value_ != other.value_;
  }
  bool operator<(const Urn& other) const {
    return value_ < other.value_;
  }

 private:
  struct Trusted {};
  Urn(std::string value, Trusted) : value_(std::move(value)) {
  }

  static std::string Canonicalize(std::string_view value);

  std::string value_;
};

} // namespace aff4::urn

namespace std {

template <>
struct hash<aff4::urn::Urn> {
  size_t operator()(const aff4::urn::Urn& urn) const noexcept {
    return hash<string>{}(urn.Value());
  }
};

} // namespace std
