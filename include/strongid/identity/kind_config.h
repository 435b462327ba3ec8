#pragma once

#include "strongid/core/uuid.h"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace strongid::identity {

// kCanonicalPattern matches `<name>-<uuid>`: one or more non-hyphen characters,
// a hyphen, then a lower-case 8-4-4-4-12 UUID captured as group 1.
inline constexpr std::string_view kCanonicalPattern =
    R"(^[^\-]+\-([a-f0-9]{8}\-[a-f0-9]{4}\-[a-f0-9]{4}\-[a-f0-9]{4}\-[a-f0-9]{12})$)";

// KindConfig is the per-kind configuration shared by every identity of one kind.
// Built once on first use of the kind and never mutated afterwards, so it is
// read concurrently without locking.
struct KindConfig {
  std::string type_name;  // NOLINT(readability-identifier-naming)
  // Includes the trailing '-'.
  std::string prefix;     // NOLINT(readability-identifier-naming)
  std::regex pattern;     // NOLINT(readability-identifier-naming)
};

// derive_prefix strips one trailing "Id" from type_name, lower-cases the rest
// (ASCII) and appends '-'. "OrderId" -> "order-".
[[nodiscard]] std::string derive_prefix(std::string_view type_name);

// make_kind_config derives the prefix and compiles kCanonicalPattern.
[[nodiscard]] KindConfig make_kind_config(std::string_view type_name);

// validate_identity checks value against config and returns one message per
// failed rule, in rule order:
//   1. empty (stops further checks)
//   2. leading/trailing whitespace (ASCII or UTF-8 encoded Unicode White_Space)
//   3. missing prefix (ordinal, case-sensitive)
//   4. not matching kCanonicalPattern, checked in linear time so input of any
//      length is safe
// An empty result means value is valid.
[[nodiscard]] std::vector<std::string> validate_identity(std::string_view value,
                                                         const KindConfig& config);

// extract_uuid re-matches a validated value and parses its UUID group.
// Throws std::logic_error if value does not match; callers only pass values
// that already passed validate_identity.
[[nodiscard]] core::Uuid extract_uuid(std::string_view value, const KindConfig& config);

}  // namespace strongid::identity
