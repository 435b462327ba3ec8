#include "strongid/core/clock.h"

#include <chrono>

namespace strongid::core {

std::uint64_t SystemClock::now_unix_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

std::uint64_t ManualClock::now_unix_ms() {
  return now_ms_.load(std::memory_order_relaxed);
}

void ManualClock::set(std::uint64_t unix_ms) {
  now_ms_.store(unix_ms, std::memory_order_relaxed);
}

void ManualClock::advance(std::uint64_t delta_ms) {
  now_ms_.fetch_add(delta_ms, std::memory_order_relaxed);
}

}  // namespace strongid::core
