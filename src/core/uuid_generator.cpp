#include "strongid/core/uuid_generator.h"

#include "strongid/core/sha1.h"

#include <algorithm>
#include <cstring>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace strongid::core {

namespace {

// Fills out with random bytes from a per-thread engine.
// thread_local engines keep generation lock-free across threads.
void fill_random(std::span<std::uint8_t> out) {
  static thread_local std::mt19937_64 engine{std::random_device{}()};
  static thread_local std::uniform_int_distribution<std::uint64_t> dist;

  std::size_t i = 0;
  while (i < out.size()) {
    std::uint64_t word = dist(engine);
    for (int k = 0; k < 8 && i < out.size(); ++k, ++i) {
      out[i] = static_cast<std::uint8_t>(word & 0xFFu);
      word >>= 8u;
    }
  }
}

// Stamp version nibble into byte 6 and RFC 4122 variant (10xx) into byte 8.
void stamp_version(Uuid& uuid, std::uint8_t version) {
  uuid.bytes[6] = static_cast<std::uint8_t>((uuid.bytes[6] & 0x0Fu) | (version << 4u));
  uuid.bytes[8] = static_cast<std::uint8_t>((uuid.bytes[8] & 0x3Fu) | 0x80u);
}

constexpr std::uint64_t kTimestampMask = 0xFFFFFFFFFFFFull;  // 48 bits

}  // namespace

Uuid random_uuid() {
  Uuid uuid;
  fill_random(uuid.bytes);
  stamp_version(uuid, 4);
  return uuid;
}

Uuid name_based_uuid(const Uuid& name_space, std::span<const std::uint8_t> name) {
  std::vector<std::uint8_t> input;
  input.reserve(name_space.bytes.size() + name.size());
  input.insert(input.end(), name_space.bytes.begin(), name_space.bytes.end());
  input.insert(input.end(), name.begin(), name.end());

  const auto digest = sha1_digest(input);

  Uuid uuid;
  std::copy_n(digest.begin(), uuid.bytes.size(), uuid.bytes.begin());
  stamp_version(uuid, 5);
  return uuid;
}

Uuid name_based_uuid(const Uuid& name_space, std::string_view name) {
  return name_based_uuid(
      name_space, std::span<const std::uint8_t>(
                      reinterpret_cast<const std::uint8_t*>(name.data()), name.size()));
}

Uuid name_based_uuid(const Uuid& name_space, const char* name) {
  if (name == nullptr) {
    throw std::invalid_argument("name_based_uuid: name must not be null");
  }
  return name_based_uuid(name_space, std::string_view{name});
}

Uuid comb_uuid() {
  static SystemClock clock;
  static CombUuidGenerator generator{clock};
  return generator.next();
}

Uuid RandomUuidGenerator::next() {
  return random_uuid();
}

Uuid CombUuidGenerator::next() {
  std::uint64_t ts = clock_.now_unix_ms() & kTimestampMask;

  // Publish max(last, now) so a regressing clock never lowers the prefix.
  std::uint64_t prev = last_ms_.load(std::memory_order_relaxed);
  while (prev < ts && !last_ms_.compare_exchange_weak(prev, ts, std::memory_order_relaxed)) {
  }
  ts = std::max(prev, ts);

  Uuid uuid;
  fill_random(std::span<std::uint8_t>(uuid.bytes).subspan(6));
  for (unsigned i = 0; i < 6u; ++i) {
    uuid.bytes[i] = static_cast<std::uint8_t>(ts >> ((5u - i) * 8u));
  }
  stamp_version(uuid, 7);
  return uuid;
}

Uuid DeterministicUuidGenerator::next() {
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed);
  return name_based_uuid(name_space_, std::to_string(c));
}

}  // namespace strongid::core
