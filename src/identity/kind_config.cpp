#include "strongid/identity/kind_config.h"

#include "strongid/core/normalization.h"

#include <stdexcept>

namespace strongid::identity {

namespace {

// Length of "-" + 8-4-4-4-12 UUID text.
constexpr std::size_t kHyphenAndUuidLength = 37;

std::string quoted_kind(const KindConfig& config) {
  return "of type '" + config.type_name + "'";
}

constexpr bool is_lower_hex(char ch) noexcept {
  return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');
}

// Same language as kCanonicalPattern, checked in one linear pass. std::regex
// recurses per character in libstdc++, so unbounded input never reaches it.
bool matches_canonical_shape(std::string_view value) noexcept {
  if (value.size() < kHyphenAndUuidLength + 1) {
    return false;
  }

  const std::string_view head = value.substr(0, value.size() - kHyphenAndUuidLength);
  if (head.find('-') != std::string_view::npos) {
    return false;
  }

  const std::string_view tail = value.substr(head.size());
  for (std::size_t i = 0; i < tail.size(); ++i) {
    // Hyphens sit before the UUID and after its 8-, 4-, 4- and 4-digit groups.
    const bool hyphen_slot = i == 0 || i == 9 || i == 14 || i == 19 || i == 24;
    if (hyphen_slot ? tail[i] != '-' : !is_lower_hex(tail[i])) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::string derive_prefix(std::string_view type_name) {
  return core::normalize_ascii_lower(core::strip_suffix(type_name, "Id")) + "-";
}

KindConfig make_kind_config(std::string_view type_name) {
  return KindConfig{
      std::string{type_name},
      derive_prefix(type_name),
      std::regex{std::string{kCanonicalPattern}, std::regex::ECMAScript | std::regex::optimize},
  };
}

std::vector<std::string> validate_identity(std::string_view value, const KindConfig& config) {
  std::vector<std::string> errors;

  if (value.empty()) {
    errors.push_back("Identity " + quoted_kind(config) + " is null or empty");
    return errors;
  }

  const std::string identity = "Identity '" + std::string{value} + "' " + quoted_kind(config);

  if (core::trim(value) != value) {
    errors.push_back(identity + " contains leading and/or trailing spaces");
  }
  if (!value.starts_with(config.prefix)) {
    errors.push_back(identity + " does not start with '" + config.prefix + "'");
  }
  if (!matches_canonical_shape(value)) {
    errors.push_back(identity + " does not follow the syntax '[NAME]-[GUID]' in lower case");
  }

  return errors;
}

core::Uuid extract_uuid(std::string_view value, const KindConfig& config) {
  // The shape check bounds the regex input to a validated value.
  std::match_results<std::string_view::const_iterator> match;
  if (!matches_canonical_shape(value) ||
      !std::regex_match(value.begin(), value.end(), match, config.pattern)) {
    throw std::logic_error("extract_uuid: '" + std::string{value} + "' is not a valid " +
                           config.type_name);
  }

  const auto uuid = core::parse_uuid(match[1].str());
  if (!uuid.has_value()) {
    throw std::logic_error("extract_uuid: unparsable UUID in '" + std::string{value} + "'");
  }
  return *uuid;
}

}  // namespace strongid::identity
