#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace strongid::core {

// SHA-1 digest length in bytes.
inline constexpr std::size_t kSha1DigestSize = 20;

// sha1_digest returns the raw SHA-1 digest of input.
//
// Implements FIPS 180-4 SHA-1. Used for RFC 4122 version 5 (name-based) UUIDs,
// where SHA-1 is mandated by the standard. Not for security purposes.
// No external dependencies, pure C++20.
[[nodiscard]] std::array<std::uint8_t, kSha1DigestSize> sha1_digest(
    std::span<const std::uint8_t> input);

}  // namespace strongid::core
