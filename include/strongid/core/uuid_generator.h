#pragma once

#include "strongid/core/clock.h"
#include "strongid/core/uuid.h"

#include <atomic>
#include <cstdint>
#include <span>
#include <string_view>

namespace strongid::core {

// random_uuid returns an RFC 4122 version 4 UUID.
// Thread-safe: each thread draws from its own engine.
[[nodiscard]] Uuid random_uuid();

// name_based_uuid returns the RFC 4122 version 5 UUID for (name_space, name).
// SHA-1 over the 16 name-space bytes followed by the name bytes; the first 16 digest
// bytes become the UUID with version 5 and variant 10 stamped in.
// Pure: the same inputs give the same UUID in every process.
[[nodiscard]] Uuid name_based_uuid(const Uuid& name_space, std::span<const std::uint8_t> name);

// String names are hashed as their UTF-8 bytes, unchanged.
[[nodiscard]] Uuid name_based_uuid(const Uuid& name_space, std::string_view name);

// Throws std::invalid_argument if name is null.
[[nodiscard]] Uuid name_based_uuid(const Uuid& name_space, const char* name);

// comb_uuid returns a time-ordered UUID from the process-wide comb generator.
// See CombUuidGenerator.
[[nodiscard]] Uuid comb_uuid();

// Abstract UUID generator interface for dependency injection.
// Allows production code to use random or time-ordered UUIDs while tests use reproducible ones.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IUuidGenerator {
 public:
  virtual ~IUuidGenerator() = default;

  virtual Uuid next() = 0;

 protected:
  IUuidGenerator() = default;
  IUuidGenerator(const IUuidGenerator&) = default;
  IUuidGenerator& operator=(const IUuidGenerator&) = default;
  IUuidGenerator(IUuidGenerator&&) = default;
  IUuidGenerator& operator=(IUuidGenerator&&) = default;
};

// Version 4 generator. Stateless; forwards to random_uuid().
class RandomUuidGenerator final : public IUuidGenerator {
 public:
  RandomUuidGenerator() = default;
  ~RandomUuidGenerator() override = default;

  RandomUuidGenerator(const RandomUuidGenerator&) = default;
  RandomUuidGenerator& operator=(const RandomUuidGenerator&) = default;
  RandomUuidGenerator(RandomUuidGenerator&&) = default;
  RandomUuidGenerator& operator=(RandomUuidGenerator&&) = default;

  Uuid next() override;
};

// Time-ordered ("comb") generator using the RFC 9562 version 7 layout:
//   bytes 0-5  big-endian Unix milliseconds
//   byte  6    version nibble 7 + 4 random bits
//   byte  8    variant 10 + 6 random bits
//   remaining  random
// The timestamp never moves backwards: if the clock regresses, the last timestamp
// issued is reused. UUIDs from the same millisecond are not ordered among themselves.
// Thread-safe.
class CombUuidGenerator final : public IUuidGenerator {
 public:
  explicit CombUuidGenerator(IClock& clock) : clock_(clock) {}
  ~CombUuidGenerator() override = default;

  // Not copyable or movable (contains atomic timestamp)
  CombUuidGenerator(const CombUuidGenerator&) = delete;
  CombUuidGenerator& operator=(const CombUuidGenerator&) = delete;
  CombUuidGenerator(CombUuidGenerator&&) = delete;
  CombUuidGenerator& operator=(CombUuidGenerator&&) = delete;

  Uuid next() override;

 private:
  IClock& clock_;
  std::atomic<std::uint64_t> last_ms_{0};
};

// Deterministic generator: name-based UUIDs over a sequential counter
// ("0", "1", "2", ...) within a fixed name space.
// For tests and demos where reproducible output is required.
// Thread-safe. Same sequence of next() calls produces same UUIDs.
class DeterministicUuidGenerator final : public IUuidGenerator {
 public:
  explicit DeterministicUuidGenerator(const Uuid& name_space) : name_space_(name_space) {}
  ~DeterministicUuidGenerator() override = default;

  // Not copyable or movable (contains atomic counter)
  DeterministicUuidGenerator(const DeterministicUuidGenerator&) = delete;
  DeterministicUuidGenerator& operator=(const DeterministicUuidGenerator&) = delete;
  DeterministicUuidGenerator(DeterministicUuidGenerator&&) = delete;
  DeterministicUuidGenerator& operator=(DeterministicUuidGenerator&&) = delete;

  Uuid next() override;

 private:
  Uuid name_space_;
  std::atomic<unsigned long long> counter_{0};
};

}  // namespace strongid::core
