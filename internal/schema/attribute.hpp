#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "aff4/store/v1/value.pb.h"

namespace aff4::schema {

enum class ValueType : std::uint8_t {
  kString = 0,
  kInteger,
  kTimestamp,
  kBytes,
  kUrn,
  kMessage,
};

enum class Multiplicity : std::uint8_t {
  kSingle = 0,
  // One version holds the whole ordered list.
  kSequence,
};

/*
  Declaration of one attribute slot on an object kind.

  `message_type` is the protobuf full name for kMessage attributes.
  `tracks` names another attribute of the same kind; a flush advances this
  attribute only when the tracked attribute really changed value.
*/
struct AttributeDescriptor {
  std::string  name;
  ValueType    type         = ValueType::kString;
  Multiplicity multiplicity = Multiplicity::kSingle;
  std::string  message_type;
  std::string  description;

  std::optional<aff4::store::v1::AttributeValue> default_value;

  std::string tracks;

  bool IsDerived() const {
    return !tracks.empty();
  }
};

std::string_view ToString(ValueType type);

} // namespace aff4::schema
