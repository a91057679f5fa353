#include "uuid.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>

namespace ito::util {

std::string GenerateUuidV4() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  static constexpr char               kHex[] = "0123456789abcdef";

  std::array<uint8_t, 16> bytes{};
  for (auto& b : bytes) b = static_cast<uint8_t>(rng());

  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

  std::string text;
  text.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) text.push_back('-');
    text.push_back(kHex[bytes[i] >> 4]);
    text.push_back(kHex[bytes[i] & 0x0F]);
  }
  return text;
}

} // namespace ito::util
