#pragma once

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "attribute.hpp"

namespace aff4::schema {

/*
  SchemaRegistry

  Maps (object kind, attribute name) to a typed descriptor. Built once at
  startup and then shared read-only; handles validate every Set() against
  it before staging.

  Kinds form a single-inheritance tree: a kind sees its own attributes and
  all attributes of its ancestors.
*/
class SchemaRegistry {
 public:
  static constexpr const char* kRootKind = "AFF4Object";

  void RegisterKind(const std::string& kind, const std::string& parent_kind, std::vector<AttributeDescriptor> attributes);

  bool HasKind(const std::string& kind) const;

  // True if `kind` is `ancestor` or derives from it.
  bool IsA(const std::string& kind, const std::string& ancestor) const;

  const AttributeDescriptor* Find(const std::string& kind, const std::string& attribute) const;

  // Throws util::SchemaViolation for unknown kinds or attributes.
  const AttributeDescriptor& Lookup(const std::string& kind, const std::string& attribute) const;

  // All attributes visible on `kind`, ancestors first.
  std::vector<const AttributeDescriptor*> Attributes(const std::string& kind) const;

  // Derived attributes on `kind` that track `attribute`.
  std::vector<const AttributeDescriptor*> DerivedFrom(const std::string& kind, const std::string& attribute) const;

  // Throws util::SchemaViolation if `value` does not fit `descriptor`.
  static void Validate(const AttributeDescriptor& descriptor, const aff4::store::v1::AttributeValue& value);

 private:
  struct KindEntry {
    std::string                                parent;
    std::map<std::string, AttributeDescriptor> attributes;
  };

  const KindEntry& Kind(const std::string& kind) const;

  std::unordered_map<std::string, KindEntry> kinds_;
};

using SchemaRegistryPtr = std::shared_ptr<const SchemaRegistry>;

} // namespace aff4::schema
