#include "strongid/core/sha1.h"

#include <cstring>
#include <vector>

namespace strongid::core {

namespace {

// FIPS 180-4 §5.3.1: SHA-1 initial hash value.
constexpr std::array<uint32_t, 5> kH0 = {
    0x67452301u, 0xefcdab89u, 0x98badcfeu, 0x10325476u, 0xc3d2e1f0u,
};

// FIPS 180-4 §4.2.1: SHA-1 constants, one per group of 20 rounds.
constexpr std::array<uint32_t, 4> kK = {
    0x5a827999u,
    0x6ed9eba1u,
    0x8f1bbcdcu,
    0xca62c1d6u,
};

constexpr uint32_t rotl32(uint32_t x, unsigned n) noexcept {
  return (x << n) | (x >> (32u - n));
}

// FIPS 180-4 §4.1.1: SHA-1 functions.
constexpr uint32_t f_round(unsigned t, uint32_t x, uint32_t y, uint32_t z) noexcept {
  if (t < 20u) {
    return (x & y) ^ (~x & z);  // Ch
  }
  if (t < 40u) {
    return x ^ y ^ z;  // Parity
  }
  if (t < 60u) {
    return (x & y) ^ (x & z) ^ (y & z);  // Maj
  }
  return x ^ y ^ z;  // Parity
}

// Process one 512-bit (64-byte) block. Mutates state in place.
void process_block(std::array<uint32_t, 5>& state, const uint8_t* block) noexcept {
  std::array<uint32_t, 80> w{};

  // FIPS 180-4 §6.1.2 step 1: prepare message schedule.
  for (unsigned i = 0; i < 16u; ++i) {
    w[i] = (static_cast<uint32_t>(block[i * 4u + 0u]) << 24u) |
           (static_cast<uint32_t>(block[i * 4u + 1u]) << 16u) |
           (static_cast<uint32_t>(block[i * 4u + 2u]) << 8u) |
           (static_cast<uint32_t>(block[i * 4u + 3u]));
  }
  for (unsigned i = 16u; i < 80u; ++i) {
    w[i] = rotl32(w[i - 3u] ^ w[i - 8u] ^ w[i - 14u] ^ w[i - 16u], 1u);
  }

  // FIPS 180-4 §6.1.2 step 2: initialize working variables.
  uint32_t a = state[0];
  uint32_t b = state[1];
  uint32_t c = state[2];
  uint32_t d = state[3];
  uint32_t e = state[4];

  // FIPS 180-4 §6.1.2 step 3: 80 rounds.
  for (unsigned t = 0; t < 80u; ++t) {
    const uint32_t temp = rotl32(a, 5u) + f_round(t, b, c, d) + e + kK[t / 20u] + w[t];
    e = d;
    d = c;
    c = rotl32(b, 30u);
    b = a;
    a = temp;
  }

  // FIPS 180-4 §6.1.2 step 4: compute intermediate hash value.
  state[0] += a;
  state[1] += b;
  state[2] += c;
  state[3] += d;
  state[4] += e;
}

}  // namespace

std::array<std::uint8_t, kSha1DigestSize> sha1_digest(std::span<const std::uint8_t> input) {
  // FIPS 180-4 §5.1.1: padding.
  // Padded message length is the smallest multiple of 512 bits (64 bytes)
  // that accommodates: original message + 1 byte (0x80) + 8 bytes (bit length).
  const uint64_t bit_len = static_cast<uint64_t>(input.size()) * 8u;
  const size_t padded_size = ((input.size() + 9u + 63u) / 64u) * 64u;

  std::vector<uint8_t> msg(padded_size, 0u);
  if (!input.empty()) {
    std::memcpy(msg.data(), input.data(), input.size());
  }
  msg[input.size()] = 0x80u;  // append bit '1' followed by zeroes

  // Append original bit length as 64-bit big-endian at the end.
  for (unsigned i = 0; i < 8u; ++i) {
    msg[padded_size - 8u + i] = static_cast<uint8_t>(bit_len >> ((7u - i) * 8u));
  }

  auto state = kH0;
  for (size_t offset = 0; offset < padded_size; offset += 64u) {
    process_block(state, msg.data() + offset);
  }

  // Big-endian serialization of the five state words.
  std::array<std::uint8_t, kSha1DigestSize> digest{};
  for (unsigned i = 0; i < 5u; ++i) {
    digest[i * 4u + 0u] = static_cast<uint8_t>(state[i] >> 24u);
    digest[i * 4u + 1u] = static_cast<uint8_t>(state[i] >> 16u);
    digest[i * 4u + 2u] = static_cast<uint8_t>(state[i] >> 8u);
    digest[i * 4u + 3u] = static_cast<uint8_t>(state[i]);
  }
  return digest;
}

}  // namespace strongid::core
