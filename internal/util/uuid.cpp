#include "uuid.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <random>

namespace resync::util {

std::string NewId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  const auto unix_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());

  std::array<std::uint8_t, 16> bytes{};
  // 48-bit big-endian millisecond timestamp
  for (int i = 0; i < 6; ++i) {
    bytes[i] = static_cast<std::uint8_t>(unix_ms >> (40 - 8 * i));
  }
  const std::uint64_t hi = rng();
  const std::uint64_t lo = rng();
  for (int i = 6; i < 16; ++i) {
    bytes[i] = static_cast<std::uint8_t>((i < 11 ? hi : lo) >> (8 * (i % 8)));
  }
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x70);
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           id;
  id.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) id += '-';
    id += kHex[bytes[i] >> 4];
    id += kHex[bytes[i] & 0x0F];
  }
  return id;
}

} // namespace resync::util
