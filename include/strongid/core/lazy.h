#pragma once

#include <atomic>
#include <mutex>
#include <utility>

namespace strongid::core {

// Lazy<T> memoizes a value computed on first request.
//
// get(compute) runs compute at most once per cell; concurrent first callers
// block on a mutex and all observe the single computed value. After
// publication readers take only an acquire load.
//
// Copying a cell carries an already computed value along; an empty cell copies
// as empty. Copy/assignment must not race with get() on the destination.
template <typename T>
class Lazy {
 public:
  Lazy() = default;
  ~Lazy() = default;

  Lazy(const Lazy& other) { copy_from(other); }
  Lazy& operator=(const Lazy& other) {
    if (this != &other) {
      ready_.store(false, std::memory_order_relaxed);
      copy_from(other);
    }
    return *this;
  }

  template <typename Compute>
  const T& get(Compute&& compute) const {
    if (!ready_.load(std::memory_order_acquire)) {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!ready_.load(std::memory_order_relaxed)) {
        value_ = std::forward<Compute>(compute)();
        ready_.store(true, std::memory_order_release);
      }
    }
    return value_;
  }

  [[nodiscard]] bool has_value() const noexcept { return ready_.load(std::memory_order_acquire); }

 private:
  void copy_from(const Lazy& other) {
    if (other.ready_.load(std::memory_order_acquire)) {
      value_ = other.value_;
      ready_.store(true, std::memory_order_release);
    }
  }

  mutable std::mutex mutex_;
  mutable std::atomic<bool> ready_{false};
  mutable T value_{};
};

}  // namespace strongid::core
