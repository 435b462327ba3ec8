#pragma once

#include "strongid/core/lazy.h"
#include "strongid/core/result.h"
#include "strongid/core/single_value_object.h"
#include "strongid/core/uuid.h"
#include "strongid/core/uuid_generator.h"
#include "strongid/identity/identity_error.h"
#include "strongid/identity/kind_config.h"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace strongid::identity {

// Identity<T> is the shared base of every typed identifier kind.
//
// A kind T derives from Identity<T> (CRTP) and provides:
//   - static constexpr std::string_view kTypeName, the kind's name ending in "Id"
//   - one public constructor T(std::string) forwarding to Identity<T>(std::string)
// STRONGID_DEFINE_IDENTITY generates such a kind.
//
// Every instance holds a canonical value `<prefix>-<uuid>`, where the prefix is
// derived from kTypeName ("OrderId" -> "order-"). Construction validates the
// value and throws IdentityFormatError on failure, so an instance is never invalid.
// The embedded UUID is parsed on the first call to uuid() and memoized.
//
// Different kinds are unrelated types: OrderId and UserId cannot be compared,
// converted or assigned to each other.
template <typename T>
class Identity : public core::SingleValueObject<T, std::string> {
 public:
  // Per-kind configuration. Initialized once on first use (thread-safe static
  // initialization) and immutable afterwards.
  static const KindConfig& config() {
    static_assert(std::is_convertible_v<decltype(T::kTypeName), std::string_view>,
                  "identity kinds must declare static constexpr std::string_view kTypeName");
    static const KindConfig kConfig = make_kind_config(T::kTypeName);
    return kConfig;
  }

  static std::string_view type_name() { return T::kTypeName; }

  // Prefix including the trailing '-', e.g. "order-".
  static const std::string& prefix() { return config().prefix; }

  // ── Generation ────────────────────────────────────────────────────────────

  static T new_id() { return with(core::random_uuid()); }

  static T new_id(core::IUuidGenerator& generator) { return with(generator.next()); }

  // Same (name_space, name) always yields the same identity.
  static T new_deterministic(const core::Uuid& name_space, std::string_view name) {
    return with(core::name_based_uuid(name_space, name));
  }
  static T new_deterministic(const core::Uuid& name_space, const char* name) {
    return with(core::name_based_uuid(name_space, name));
  }
  static T new_deterministic(const core::Uuid& name_space,
                             std::span<const std::uint8_t> name_bytes) {
    return with(core::name_based_uuid(name_space, name_bytes));
  }

  // Time-ordered identity; later calls sort after earlier ones by timestamp.
  static T new_comb() { return with(core::comb_uuid()); }

  // ── Construction ──────────────────────────────────────────────────────────

  // Builds T from a canonical value. Exceptions from T's constructor, including
  // IdentityFormatError, reach the caller unchanged.
  static T with(std::string value) { return T(std::move(value)); }

  static T with(const core::Uuid& uuid) { return with(prefix() + core::to_string(uuid)); }

  // Non-throwing variant of with(std::string) for validation failures.
  static core::Result<T, IdentityError> try_with(std::string value) {
    auto errors = validate(value);
    if (!errors.empty()) {
      return core::Result<T, IdentityError>::err(IdentityError{std::move(errors)});
    }
    return core::Result<T, IdentityError>::ok(T(std::move(value)));
  }

  // ── Validation ────────────────────────────────────────────────────────────

  [[nodiscard]] static bool is_valid(std::string_view value) { return validate(value).empty(); }
  [[nodiscard]] static bool is_valid(const char* value) { return validate(value).empty(); }

  [[nodiscard]] static std::vector<std::string> validate(std::string_view value) {
    return validate_identity(value, config());
  }

  // A null pointer is reported the same way as an empty value.
  [[nodiscard]] static std::vector<std::string> validate(const char* value) {
    return validate_identity(value == nullptr ? std::string_view{} : std::string_view{value},
                             config());
  }

  // ── Instance ──────────────────────────────────────────────────────────────

  [[nodiscard]] const core::Uuid& uuid() const {
    return uuid_.get([this] { return extract_uuid(this->value(), config()); });
  }

 protected:
  explicit Identity(std::string value)
      : core::SingleValueObject<T, std::string>(checked(std::move(value))) {}

 private:
  static std::string checked(std::string value) {
    auto errors = validate(value);
    if (!errors.empty()) {
      throw IdentityFormatError(std::move(errors));
    }
    return value;
  }

  core::Lazy<core::Uuid> uuid_;
};

// IdentityKind is satisfied by concrete kinds built on Identity<T>.
template <typename T>
concept IdentityKind = requires {
  { T::kTypeName } -> std::convertible_to<std::string_view>;
} && std::derived_from<T, Identity<T>>;

}  // namespace strongid::identity

template <strongid::identity::IdentityKind T>
struct std::hash<T> {
  std::size_t operator()(const T& id) const noexcept { return std::hash<std::string>{}(id.value()); }
};

// Declares identity kind `Name` with kTypeName "Name" and the required
// single-argument constructor.
#define STRONGID_DEFINE_IDENTITY(Name)                                                      \
  class Name final : public ::strongid::identity::Identity<Name> {                         \
   public:                                                                                  \
    static constexpr std::string_view kTypeName = #Name;                                    \
    explicit Name(std::string value) : ::strongid::identity::Identity<Name>(std::move(value)) {} \
  }
