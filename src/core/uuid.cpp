#include "strongid/core/uuid.h"

namespace strongid::core {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

// Byte offsets after which a hyphen is written (8-4-4-4-12 grouping).
constexpr bool hyphen_after(std::size_t byte_index) noexcept {
  return byte_index == 3 || byte_index == 5 || byte_index == 7 || byte_index == 9;
}

constexpr int hex_value(char ch) noexcept {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string to_string(const Uuid& uuid) {
  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < uuid.bytes.size(); ++i) {
    out.push_back(kHexDigits[uuid.bytes[i] >> 4]);
    out.push_back(kHexDigits[uuid.bytes[i] & 0x0Fu]);
    if (hyphen_after(i)) {
      out.push_back('-');
    }
  }
  return out;
}

std::optional<Uuid> parse_uuid(std::string_view text) {
  if (text.size() != 36) {
    return std::nullopt;
  }

  Uuid uuid;
  std::size_t pos = 0;
  for (std::size_t i = 0; i < uuid.bytes.size(); ++i) {
    const int hi = hex_value(text[pos]);
    const int lo = hex_value(text[pos + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    uuid.bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    pos += 2;

    if (hyphen_after(i)) {
      if (text[pos] != '-') {
        return std::nullopt;
      }
      ++pos;
    }
  }
  return uuid;
}

std::ostream& operator<<(std::ostream& os, const Uuid& uuid) {
  return os << to_string(uuid);
}

}  // namespace strongid::core
