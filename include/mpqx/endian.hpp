#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

namespace mpqx {

// C++20-compatible byteswap (C++23 has std::byteswap)
namespace detail {

inline constexpr uint16_t byteswap(uint16_t value) noexcept {
  return static_cast<uint16_t>((value << 8) | (value >> 8));
}

inline constexpr uint32_t byteswap(uint32_t value) noexcept {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

inline constexpr uint64_t byteswap(uint64_t value) noexcept {
  return (static_cast<uint64_t>(byteswap(static_cast<uint32_t>(value))) << 32) |
         byteswap(static_cast<uint32_t>(value >> 32));
}

} // namespace detail

inline constexpr bool is_little_endian() noexcept {
  return std::endian::native == std::endian::little;
}

// MPQ structures are little-endian on disk
template <typename T> inline constexpr T letoh(T value) noexcept {
  if constexpr (is_little_endian()) {
    return value;
  }
  return detail::byteswap(value);
}

template <typename T> inline constexpr T htole(T value) noexcept {
  return letoh(value);
}

// The sparse codec stores its length prefix big-endian
inline constexpr uint32_t betoh32(uint32_t value) noexcept {
  if constexpr (is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

inline constexpr uint32_t htobe32(uint32_t value) noexcept {
  return betoh32(value);
}

// Unaligned little-endian loads and stores
inline uint16_t load16(const uint8_t *p) noexcept {
  uint16_t value;
  std::memcpy(&value, p, sizeof(value));
  return letoh(value);
}

inline uint32_t load32(const uint8_t *p) noexcept {
  uint32_t value;
  std::memcpy(&value, p, sizeof(value));
  return letoh(value);
}

inline uint64_t load64(const uint8_t *p) noexcept {
  uint64_t value;
  std::memcpy(&value, p, sizeof(value));
  return letoh(value);
}

inline void store16(uint8_t *p, uint16_t value) noexcept {
  value = htole(value);
  std::memcpy(p, &value, sizeof(value));
}

inline void store32(uint8_t *p, uint32_t value) noexcept {
  value = htole(value);
  std::memcpy(p, &value, sizeof(value));
}

inline void store64(uint8_t *p, uint64_t value) noexcept {
  value = htole(value);
  std::memcpy(p, &value, sizeof(value));
}

} // namespace mpqx
