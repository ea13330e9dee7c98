#include "urn.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace aff4::urn {

namespace {

// Scheme-looking prefix: a letter followed by at least one more scheme
// character and a ':'. Single letters are drive names, not schemes.
bool HasForeignScheme(std::string_view value) {
  if (value.empty() || !std::isalpha(static_cast<unsigned char>(value[0]))) return false;

  size_t i = 1;
  while (i < value.size()) {
    const auto c = static_cast<unsigned char>(value[i]);
    if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') break;
    ++i;
  }
  return i >= 2 && i < value.size() && value[i] == ':';
}

} // namespace

Urn::Urn() : value_(kRoot) {
}

Urn::Urn(const std::string& value) : value_(Canonicalize(value)) {
}

Urn::Urn(const char* value) : value_(Canonicalize(value ? std::string_view(value) : std::string_view())) {
}

std::string Urn::Canonicalize(std::string_view value) {
  if (value.empty()) {
    throw util::InvalidUrn("empty urn");
  }
  if (value.find('\0') != std::string_view::npos) {
    throw util::InvalidUrn("urn contains a NUL byte");
  }

  if (value.substr(0, kScheme.size()) == kScheme) {
    if (value.size() == kScheme.size() || value[kScheme.size()] != '/') {
      throw util::InvalidUrn("urn is not root-anchored: " + std::string(value));
    }
    return std::string(value);
  }

  if (HasForeignScheme(value)) {
    throw util::InvalidUrn("unsupported urn scheme: " + std::string(value));
  }

  std::string_view relative = value;
  if (relative.front() == '/') relative.remove_prefix(1);
  return std::string(kRoot) + std::string(relative);
}

bool Urn::IsValid(std::string_view value) {
  try {
    Canonicalize(value);
    return true;
  } catch (const util::InvalidUrn&) {
    return false;
  }
}

Urn Urn::Add(std::string_view component) const {
  if (component.find('\0') != std::string_view::npos) {
    throw util::InvalidUrn("urn component contains a NUL byte");
  }

  std::string value = value_;
  if (value.back() != '/') value.push_back('/');
  value.append(component);
  return Urn(std::move(value), Trusted{});
}

std::string_view Urn::Path() const {
  return std::string_view(value_).substr(kScheme.size());
}

bool Urn::IsRoot() const {
  return value_.size() == kRoot.size();
}

std::string Urn::RootId() const {
  const auto rest = std::string_view(value_).substr(kRoot.size());
  const auto end  = rest.find('/');
  return std::string(end == std::string_view::npos ? rest : rest.substr(0, end));
}

std::string Urn::Basename() const {
  if (IsRoot()) return {};
  const auto pos = value_.rfind('/');
  return value_.substr(pos + 1);
}

Urn Urn::Dirname() const {
  if (IsRoot()) return *this;
  const auto pos = value_.rfind('/');
  if (pos + 1 <= kRoot.size()) return Urn();
  return Urn(value_.substr(0, pos), Trusted{});
}

bool Urn::IsChildOf(const Urn& parent) const {
  if (value_.size() <= parent.value_.size()) return false;
  if (value_.compare(0, parent.value_.size(), parent.value_) != 0) return false;
  return parent.value_.back() == '/' || value_[parent.value_.size()] == '/';
}

std::string Urn::RelativeName(const Urn& parent) const {
  if (*this == parent) return {};
  if (!IsChildOf(parent)) {
    throw util::InvalidUrn(value_ + " is not below " + parent.value_);
  }
  auto offset = parent.value_.size();
  if (value_[offset] == '/') ++offset;
  return value_.substr(offset);
}

} // namespace aff4::urn
