#pragma once

#include <array>
#include <string>
#include <string_view>

namespace strongid::core {

// Deterministic byte-level string helpers.
// These functions are locale-independent and produce byte-stable output
// across all platforms and compilers.
// - ASCII lowercasing: A-Z → a-z via explicit char math (no std::tolower)
// - Whitespace: ASCII space, \t, \n, \r, \v, \f plus the UTF-8 encodings of the
//   non-ASCII Unicode White_Space code points

// is_ascii_space reports whether ch is one of the six ASCII whitespace characters.
constexpr bool is_ascii_space(const char ch) noexcept {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII characters are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    // ES.46: Avoid lossy conversions - explicit range check
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// UTF-8 encodings of U+0085, U+00A0, U+1680, U+2000..U+200A, U+2028, U+2029,
// U+202F, U+205F and U+3000.
inline constexpr std::array<std::string_view, 19> kUtf8Spaces = {
    "\xC2\x85",     "\xC2\xA0",     "\xE1\x9A\x80", "\xE2\x80\x80", "\xE2\x80\x81",
    "\xE2\x80\x82", "\xE2\x80\x83", "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86",
    "\xE2\x80\x87", "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A", "\xE2\x80\xA8",
    "\xE2\x80\xA9", "\xE2\x80\xAF", "\xE2\x81\x9F", "\xE3\x80\x80",
};

// leading_space_length returns the byte length of the whitespace character
// starting input, or 0.
constexpr std::size_t leading_space_length(const std::string_view input) noexcept {
  if (input.empty()) {
    return 0;
  }
  if (is_ascii_space(input.front())) {
    return 1;
  }
  for (const std::string_view space : kUtf8Spaces) {
    if (input.starts_with(space)) {
      return space.size();
    }
  }
  return 0;
}

// trailing_space_length returns the byte length of the whitespace character
// ending input, or 0.
constexpr std::size_t trailing_space_length(const std::string_view input) noexcept {
  if (input.empty()) {
    return 0;
  }
  if (is_ascii_space(input.back())) {
    return 1;
  }
  for (const std::string_view space : kUtf8Spaces) {
    if (input.ends_with(space)) {
      return space.size();
    }
  }
  return 0;
}

// trim removes leading and trailing whitespace (ASCII and UTF-8 Unicode spaces).
constexpr std::string_view trim(std::string_view input) noexcept {
  while (const std::size_t n = leading_space_length(input)) {
    input.remove_prefix(n);
  }
  while (const std::size_t n = trailing_space_length(input)) {
    input.remove_suffix(n);
  }
  return input;
}

// strip_suffix returns input without one trailing occurrence of suffix.
// The comparison is ordinal; input is returned unchanged when it does not end with suffix.
constexpr std::string_view strip_suffix(const std::string_view input,
                                        const std::string_view suffix) noexcept {
  if (input.ends_with(suffix)) {
    return input.substr(0, input.size() - suffix.size());
  }
  return input;
}

}  // namespace strongid::core
