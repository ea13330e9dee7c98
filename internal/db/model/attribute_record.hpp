#pragma once

#include <cstdint>
#include <string>

namespace aff4::db::model {

/*
  One immutable attribute version.

  `value` is a serialized aff4.store.v1.AttributeValue; the repository
  treats it as opaque bytes.
*/

struct AttributeRecord {
  std::string urn;
  std::string attribute;

  // microseconds since epoch
  uint64_t timestamp_us = 0;

  std::string value;
};

} // namespace aff4::db::model
