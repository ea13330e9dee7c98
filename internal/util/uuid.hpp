#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace aff4::util {

/*
  UUID helpers

  Raw 16 byte RFC4122 version 4 UUIDs.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Upper-case hex of the first `bytes` bytes, used for short object ids.
std::string ToShortHex(const UUID& id, size_t bytes);

} // namespace aff4::util
