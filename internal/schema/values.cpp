#include "values.hpp"

#include <google/protobuf/util/message_differencer.h>

namespace aff4::schema::values {

AttributeValue String(std::string_view value) {
  AttributeValue v;
  v.set_string_value(std::string(value));
  return v;
}

AttributeValue Integer(int64_t value) {
  AttributeValue v;
  v.set_integer_value(value);
  return v;
}

AttributeValue Timestamp(util::Timestamp micros) {
  AttributeValue v;
  v.set_timestamp_value(micros);
  return v;
}

AttributeValue Bytes(std::string_view value) {
  AttributeValue v;
  v.set_bytes_value(std::string(value));
  return v;
}

AttributeValue UrnValue(const urn::Urn& value) {
  AttributeValue v;
  v.set_urn_value(value.Value());
  return v;
}

AttributeValue Message(const google::protobuf::Message& message) {
  AttributeValue v;
  v.mutable_message_value()->PackFrom(message);
  return v;
}

AttributeValue List(std::initializer_list<AttributeValue> items) {
  AttributeValue v;
  auto*          list = v.mutable_list_value();
  for (const auto& item : items) {
    *list->add_items() = item;
  }
  return v;
}

AttributeValue List(const std::vector<AttributeValue>& items) {
  AttributeValue v;
  auto*          list = v.mutable_list_value();
  for (const auto& item : items) {
    *list->add_items() = item;
  }
  return v;
}

AttributeValue StringList(const std::vector<std::string>& items) {
  AttributeValue v;
  auto*          list = v.mutable_list_value();
  for (const auto& item : items) {
    list->add_items()->set_string_value(item);
  }
  return v;
}

std::string MessageTypeName(const AttributeValue& value) {
  if (!value.has_message_value()) return {};

  const auto& type_url = value.message_value().type_url();
  const auto  slash    = type_url.rfind('/');
  return slash == std::string::npos ? type_url : type_url.substr(slash + 1);
}

bool Equals(const AttributeValue& lhs, const AttributeValue& rhs) {
  return google::protobuf::util::MessageDifferencer::Equals(lhs, rhs);
}

} // namespace aff4::schema::values
