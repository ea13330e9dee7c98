#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/message.h>

#include "aff4/store/v1/value.pb.h"
#include "internal/urn/urn.hpp"
#include "internal/util/time.hpp"

namespace aff4::schema::values {

/*
  Builders for AttributeValue.
*/

using aff4::store::v1::AttributeValue;

AttributeValue String(std::string_view value);
AttributeValue Integer(int64_t value);
AttributeValue Timestamp(util::Timestamp micros);
AttributeValue Bytes(std::string_view value);
AttributeValue UrnValue(const urn::Urn& value);
AttributeValue Message(const google::protobuf::Message& message);

AttributeValue List(std::initializer_list<AttributeValue> items);
AttributeValue List(const std::vector<AttributeValue>& items);

AttributeValue StringList(const std::vector<std::string>& items);

template <typename Range>
AttributeValue MessageList(const Range& messages) {
  AttributeValue value;
  auto*          list = value.mutable_list_value();
  for (const auto& message : messages) {
    *list->add_items() = Message(message);
  }
  return value;
}

// Full protobuf type name carried by a message value, or empty.
std::string MessageTypeName(const AttributeValue& value);

bool Equals(const AttributeValue& lhs, const AttributeValue& rhs);

} // namespace aff4::schema::values
