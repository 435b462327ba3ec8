#pragma once

#include <compare>
#include <ostream>
#include <utility>

namespace strongid::core {

// SingleValueObject wraps exactly one value of type V behind a distinct type.
//
// Derived is the concrete wrapper (CRTP). Comparison and stream operators are
// hidden friends taking Derived, so two different wrappers are never comparable
// with each other even when they hold the same V.
template <typename Derived, typename V>
class SingleValueObject {
 public:
  [[nodiscard]] const V& value() const noexcept { return value_; }

  friend bool operator==(const Derived& lhs, const Derived& rhs) {
    return lhs.value() == rhs.value();
  }
  friend auto operator<=>(const Derived& lhs, const Derived& rhs) {
    return lhs.value() <=> rhs.value();
  }
  friend std::ostream& operator<<(std::ostream& os, const Derived& object) {
    return os << object.value();
  }

 protected:
  explicit SingleValueObject(V value) : value_(std::move(value)) {}
  ~SingleValueObject() = default;

  // No move operations: rvalues copy, so a moved-from object still holds its value.
  SingleValueObject(const SingleValueObject&) = default;
  SingleValueObject& operator=(const SingleValueObject&) = default;

 private:
  V value_;
};

}  // namespace strongid::core
