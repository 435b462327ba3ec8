#pragma once

#include <concepts>
#include <optional>
#include <string_view>

namespace strongid::identity {

// HasStringValue matches any object exposing a string-like value().
template <typename V>
concept HasStringValue = requires(const V& v) {
  { v.value() } -> std::convertible_to<std::string_view>;
};

// is_none reports whether an identity-like object is absent or holds an empty value.
// Does no format validation.
template <HasStringValue V>
[[nodiscard]] bool is_none(const V* v) {
  return v == nullptr || std::string_view{v->value()}.empty();
}

template <HasStringValue V>
[[nodiscard]] bool is_none(const std::optional<V>& v) {
  return !v.has_value() || is_none(&*v);
}

}  // namespace strongid::identity
