#include "uuid.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace aff4::util {

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i==4||i==6||i==8||i==10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(id[i]);
  }
  return oss.str();
}

UUID FromString(const std::string& str) {
  UUID id{};
  std::string hex;

  for (char c : str)
    if (c != '-') hex += c;

  if (hex.size() != 32)
    throw std::runtime_error("Invalid UUID string");

  for (size_t i = 0; i < 16; ++i)
    id[i] = static_cast<uint8_t>(std::stoul(hex.substr(i*2,2), nullptr, 16));

  return id;
}

std::string ToShortHex(const UUID& id, size_t bytes) {
  if (bytes > id.size())
    throw std::invalid_argument("ToShortHex: byte count exceeds UUID size");

  std::ostringstream oss;
  oss << std::uppercase << std::hex;
  for (size_t i = 0; i < bytes; ++i)
    oss << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
  return oss.str();
}

} // namespace aff4::util
