#pragma once

#include <bit>
#include <cstdint>

namespace decloc {

// Byte swapping for the toolchains that lack C++23 std::byteswap
namespace detail {

inline constexpr uint16_t byteswap(uint16_t value) noexcept {
  return static_cast<uint16_t>((value << 8) | (value >> 8));
}

inline constexpr uint32_t byteswap(uint32_t value) noexcept {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

inline constexpr uint64_t byteswap(uint64_t value) noexcept {
  return ((value & 0x00000000000000FFull) << 56) | ((value & 0x000000000000FF00ull) << 40) |
         ((value & 0x0000000000FF0000ull) << 24) | ((value & 0x00000000FF000000ull) << 8) |
         ((value & 0x000000FF00000000ull) >> 8) | ((value & 0x0000FF0000000000ull) >> 24) |
         ((value & 0x00FF000000000000ull) >> 40) | ((value & 0xFF00000000000000ull) >> 56);
}

} // namespace detail

inline constexpr bool is_little_endian() noexcept {
  return std::endian::native == std::endian::little;
}

// Decima core files store every integer little-endian. The names avoid the
// glibc <endian.h> macros (htole32 and friends).

inline constexpr uint16_t le_to_host16(uint16_t value) noexcept {
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

inline constexpr uint32_t le_to_host32(uint32_t value) noexcept {
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

inline constexpr uint64_t le_to_host64(uint64_t value) noexcept {
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

inline constexpr uint16_t host_to_le16(uint16_t value) noexcept { return le_to_host16(value); }
inline constexpr uint32_t host_to_le32(uint32_t value) noexcept { return le_to_host32(value); }
inline constexpr uint64_t host_to_le64(uint64_t value) noexcept { return le_to_host64(value); }

} // namespace decloc
