#pragma once

#include <utility>
#include <variant>

namespace strongid::core {

// Result<T, E> holds either a built value or the reason it could not be built.
// Identity<T>::try_with returns Result<T, IdentityError>: the identity when the
// candidate string validates, otherwise every validation message, without
// throwing. Check has_value() before calling value() or error().
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] const T& value() const { return std::get<T>(data_); }
  [[nodiscard]] const E& error() const { return std::get<E>(data_); }

 private:
  explicit Result(T value) : data_(std::move(value)) {}
  explicit Result(E error) : data_(std::move(error)) {}

  std::variant<T, E> data_;
};

}  // namespace strongid::core
