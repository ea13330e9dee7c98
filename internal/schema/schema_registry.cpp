#include "schema_registry.hpp"

#include "internal/util/errors.hpp"
#include "values.hpp"

namespace aff4::schema {

using aff4::store::v1::AttributeValue;

std::string_view ToString(ValueType type) {
  switch (type) {
    case ValueType::kString:
      return "string";
    case ValueType::kInteger:
      return "integer";
    case ValueType::kTimestamp:
      return "timestamp";
    case ValueType::kBytes:
      return "bytes";
    case ValueType::kUrn:
      return "urn";
    case ValueType::kMessage:
      return "message";
  }
  return "unknown";
}

namespace {

bool MatchesElementType(const AttributeDescriptor& descriptor, const AttributeValue& value) {
  switch (descriptor.type) {
    case ValueType::kString:
      return value.kind_case() == AttributeValue::kStringValue;
    case ValueType::kInteger:
      return value.kind_case() == AttributeValue::kIntegerValue;
    case ValueType::kTimestamp:
      return value.kind_case() == AttributeValue::kTimestampValue;
    case ValueType::kBytes:
      return value.kind_case() == AttributeValue::kBytesValue;
    case ValueType::kUrn:
      return value.kind_case() == AttributeValue::kUrnValue && urn::Urn::IsValid(value.urn_value());
    case ValueType::kMessage:
      return value.kind_case() == AttributeValue::kMessageValue && values::MessageTypeName(value) == descriptor.message_type;
  }
  return false;
}

std::string Expected(const AttributeDescriptor& descriptor) {
  std::string expected(ToString(descriptor.type));
  if (descriptor.type == ValueType::kMessage) expected += " " + descriptor.message_type;
  if (descriptor.multiplicity == Multiplicity::kSequence) expected = "sequence of " + expected;
  return expected;
}

} // namespace

void SchemaRegistry::RegisterKind(const std::string& kind, const std::string& parent_kind, std::vector<AttributeDescriptor> attributes) {
  if (kind.empty()) {
    throw util::SchemaViolation("object kind name must not be empty");
  }
  if (kinds_.contains(kind)) {
    throw util::SchemaViolation("object kind already registered: " + kind);
  }
  if (!parent_kind.empty() && !kinds_.contains(parent_kind)) {
    throw util::SchemaViolation("unknown parent kind " + parent_kind + " for " + kind);
  }

  KindEntry entry;
  entry.parent = parent_kind;
  for (auto& attribute : attributes) {
    if (attribute.name.empty()) {
      throw util::SchemaViolation("attribute without a name on kind " + kind);
    }
    if (attribute.type == ValueType::kMessage && attribute.message_type.empty()) {
      throw util::SchemaViolation("message attribute " + attribute.name + " declares no message type");
    }
    if (!parent_kind.empty() && Find(parent_kind, attribute.name)) {
      throw util::SchemaViolation("attribute " + attribute.name + " redeclared on kind " + kind);
    }
    if (attribute.default_value) {
      Validate(attribute, *attribute.default_value);
    }

    auto name = attribute.name;
    if (!entry.attributes.emplace(name, std::move(attribute)).second) {
      throw util::SchemaViolation("attribute " + name + " declared twice on kind " + kind);
    }
  }

  // derived attributes must track something this kind can see
  for (const auto& [name, descriptor] : entry.attributes) {
    if (!descriptor.IsDerived()) continue;
    const bool local     = entry.attributes.contains(descriptor.tracks);
    const bool inherited = !parent_kind.empty() && Find(parent_kind, descriptor.tracks) != nullptr;
    if (!local && !inherited) {
      throw util::SchemaViolation("attribute " + name + " tracks unknown attribute " + descriptor.tracks);
    }
    if (descriptor.tracks == name) {
      throw util::SchemaViolation("attribute " + name + " tracks itself");
    }
  }

  kinds_.emplace(kind, std::move(entry));
}

bool SchemaRegistry::HasKind(const std::string& kind) const {
  return kinds_.contains(kind);
}

const SchemaRegistry::KindEntry& SchemaRegistry::Kind(const std::string& kind) const {
  auto it = kinds_.find(kind);
  if (it == kinds_.end()) {
    throw util::SchemaViolation("unknown object kind: " + kind);
  }
  return it->second;
}

bool SchemaRegistry::IsA(const std::string& kind, const std::string& ancestor) const {
  for (auto current = kind; !current.empty(); current = Kind(current).parent) {
    if (current == ancestor) return true;
  }
  return false;
}

const AttributeDescriptor* SchemaRegistry::Find(const std::string& kind, const std::string& attribute) const {
  for (auto current = kind; !current.empty();) {
    const auto& entry = Kind(current);
    auto        it    = entry.attributes.find(attribute);
    if (it != entry.attributes.end()) return &it->second;
    current = entry.parent;
  }
  return nullptr;
}

const AttributeDescriptor& SchemaRegistry::Lookup(const std::string& kind, const std::string& attribute) const {
  const auto* descriptor = Find(kind, attribute);
  if (!descriptor) {
    throw util::SchemaViolation("attribute " + attribute + " is not defined on kind " + kind);
  }
  return *descriptor;
}

std::vector<const AttributeDescriptor*> SchemaRegistry::Attributes(const std::string& kind) const {
  std::vector<std::string> lineage;
  for (auto current = kind; !current.empty(); current = Kind(current).parent) {
    lineage.push_back(current);
  }

  std::vector<const AttributeDescriptor*> out;
  for (auto it = lineage.rbegin(); it != lineage.rend(); ++it) {
    for (const auto& [_, descriptor] : Kind(*it).attributes) {
      out.push_back(&descriptor);
    }
  }
  return out;
}

std::vector<const AttributeDescriptor*> SchemaRegistry::DerivedFrom(const std::string& kind, const std::string& attribute) const {
  std::vector<const AttributeDescriptor*> out;
  for (const auto* descriptor : Attributes(kind)) {
    if (descriptor->tracks == attribute) out.push_back(descriptor);
  }
  return out;
}

void SchemaRegistry::Validate(const AttributeDescriptor& descriptor, const AttributeValue& value) {
  bool ok = false;

  if (descriptor.multiplicity == Multiplicity::kSequence) {
    ok = value.kind_case() == AttributeValue::kListValue;
    if (ok) {
      for (const auto& item : value.list_value().items()) {
        if (!MatchesElementType(descriptor, item)) {
          ok = false;
          break;
        }
      }
    }
  } else {
    ok = MatchesElementType(descriptor, value);
  }

  if (!ok) {
    throw util::SchemaViolation("attribute " + descriptor.name + " expects " + Expected(descriptor));
  }
}

} // namespace aff4::schema
