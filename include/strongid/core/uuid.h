#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace strongid::core {

// Uuid is a 128-bit RFC 4122 identifier stored as 16 bytes in network order.
// Regular value type (C.11): copyable, totally ordered by byte sequence.
// Because bytes are compared most-significant first, byte order and canonical
// string order agree.
struct Uuid {
  std::array<std::uint8_t, 16> bytes{};  // NOLINT(readability-identifier-naming)

  auto operator<=>(const Uuid&) const = default;

  static constexpr Uuid nil() noexcept { return Uuid{}; }

  [[nodiscard]] constexpr bool is_nil() const noexcept { return *this == Uuid{}; }

  // version returns the high nibble of byte 6 (4 = random, 5 = name-based SHA-1, 7 = time-ordered).
  [[nodiscard]] constexpr int version() const noexcept { return bytes[6] >> 4; }

  // has_rfc4122_variant reports whether the two high bits of byte 8 are `10`.
  [[nodiscard]] constexpr bool has_rfc4122_variant() const noexcept {
    return (bytes[8] & 0xC0u) == 0x80u;
  }
};

// to_string returns the canonical lower-case 8-4-4-4-12 representation.
[[nodiscard]] std::string to_string(const Uuid& uuid);

// parse_uuid parses the 36-character hyphenated form.
// Hex digits may be upper or lower case. Returns nullopt for anything else:
// wrong length, misplaced hyphens, non-hex characters, braces or surrounding space.
[[nodiscard]] std::optional<Uuid> parse_uuid(std::string_view text);

std::ostream& operator<<(std::ostream& os, const Uuid& uuid);

// Well-known name-space identifiers from RFC 4122 Appendix C.
namespace namespaces {

inline constexpr Uuid kDns{{0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0,
                            0x4f, 0xd4, 0x30, 0xc8}};
inline constexpr Uuid kUrl{{0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0,
                            0x4f, 0xd4, 0x30, 0xc8}};
inline constexpr Uuid kOid{{0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0,
                            0x4f, 0xd4, 0x30, 0xc8}};
inline constexpr Uuid kX500{{0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00,
                             0xc0, 0x4f, 0xd4, 0x30, 0xc8}};

}  // namespace namespaces

}  // namespace strongid::core

template <>
struct std::hash<strongid::core::Uuid> {
  std::size_t operator()(const strongid::core::Uuid& uuid) const noexcept {
    // FNV-1a over the raw bytes.
    std::uint64_t h = 0xcbf29ce484222325ull;
    for (const std::uint8_t b : uuid.bytes) {
      h ^= b;
      h *= 0x100000001b3ull;
    }
    return static_cast<std::size_t>(h);
  }
};
