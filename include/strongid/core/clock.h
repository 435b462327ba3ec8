#pragma once

#include <atomic>
#include <cstdint>

namespace strongid::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests use controlled timestamps.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return milliseconds elapsed since the Unix epoch (UTC).
  virtual std::uint64_t now_unix_ms() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::uint64_t now_unix_ms() override;
};

// Manual clock: returns a caller-controlled timestamp for deterministic tests.
// Thread-safe: set/advance may race with now_unix_ms.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(std::uint64_t start_unix_ms) : now_ms_(start_unix_ms) {}
  ~ManualClock() override = default;

  // Not copyable or movable (contains atomic)
  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  std::uint64_t now_unix_ms() override;

  void set(std::uint64_t unix_ms);
  void advance(std::uint64_t delta_ms);

 private:
  std::atomic<std::uint64_t> now_ms_;
};

}  // namespace strongid::core
