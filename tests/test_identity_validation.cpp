#include "strongid/identity/identity_error.h"
#include "strongid/identity/kind_config.h"
#include "test_kinds.h"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace strongid::identity;
using test_kinds::HTTPRequestId;
using test_kinds::InvoiceId;
using test_kinds::OrderId;
using test_kinds::Shipment;

namespace {

constexpr const char* kValidOrder = "order-3fa85f64-5717-4562-b3fc-2c963f66afa6";

}  // namespace

// ── Prefix derivation ──────────────────────────────────────────────────────

TEST_CASE("derive_prefix: strips trailing Id and lower-cases", "[identity][prefix]") {
  CHECK(derive_prefix("OrderId") == "order-");
  CHECK(derive_prefix("InvoiceId") == "invoice-");
  CHECK(derive_prefix("HTTPRequestId") == "httprequest-");
  CHECK(derive_prefix("Identity") == "identity-");
  CHECK(derive_prefix("Shipment") == "shipment-");
  CHECK(derive_prefix("IdId") == "id-");
}

TEST_CASE("Identity::prefix: derived from the kind's type name", "[identity][prefix]") {
  CHECK(OrderId::prefix() == "order-");
  CHECK(InvoiceId::prefix() == "invoice-");
  CHECK(HTTPRequestId::prefix() == "httprequest-");
  CHECK(Shipment::prefix() == "shipment-");
  CHECK(OrderId::type_name() == "OrderId");
}

TEST_CASE("Identity::config: one configuration object per kind", "[identity][prefix]") {
  CHECK(&OrderId::config() == &OrderId::config());
  CHECK(&OrderId::config() != &InvoiceId::config());
  CHECK(OrderId::config().type_name == "OrderId");
}

// ── validate ───────────────────────────────────────────────────────────────

TEST_CASE("validate: canonical value has no errors", "[identity][validation]") {
  CHECK(OrderId::validate(kValidOrder).empty());
  CHECK(OrderId::is_valid(kValidOrder));
  CHECK(OrderId::is_valid(std::string{kValidOrder}));
}

TEST_CASE("validate: empty value reports a single error", "[identity][validation]") {
  const auto errors = OrderId::validate("");
  REQUIRE(errors.size() == 1);
  CHECK(errors[0] == "Identity of type 'OrderId' is null or empty");
}

TEST_CASE("validate: null pointer is reported as null or empty", "[identity][validation]") {
  const char* value = nullptr;
  const auto errors = OrderId::validate(value);
  REQUIRE(errors.size() == 1);
  CHECK(errors[0] == "Identity of type 'OrderId' is null or empty");
  CHECK_FALSE(OrderId::is_valid(value));
}

TEST_CASE("validate: leading whitespace fails whitespace and prefix and syntax rules",
          "[identity][validation]") {
  const std::string value = std::string{" "} + kValidOrder;
  const auto errors = OrderId::validate(value);
  REQUIRE(errors.size() == 3);
  CHECK(errors[0] == "Identity '" + value +
                         "' of type 'OrderId' contains leading and/or trailing spaces");
  CHECK(errors[1] == "Identity '" + value + "' of type 'OrderId' does not start with 'order-'");
  CHECK(errors[2] == "Identity '" + value +
                         "' of type 'OrderId' does not follow the syntax '[NAME]-[GUID]' in "
                         "lower case");
}

TEST_CASE("validate: trailing whitespace fails whitespace and syntax rules",
          "[identity][validation]") {
  for (const char* suffix : {" ", "\t", "\n", "\r\n"}) {
    const std::string value = std::string{kValidOrder} + suffix;
    const auto errors = OrderId::validate(value);
    REQUIRE(errors.size() == 2);
    CHECK(errors[0].ends_with("contains leading and/or trailing spaces"));
    CHECK(errors[1].ends_with("does not follow the syntax '[NAME]-[GUID]' in lower case"));
  }
}

TEST_CASE("validate: Unicode whitespace counts as leading or trailing spaces",
          "[identity][validation]") {
  const std::string leading = std::string{"\xC2\xA0"} + kValidOrder;
  const auto leading_errors = OrderId::validate(leading);
  REQUIRE(leading_errors.size() == 3);
  CHECK(leading_errors[0].ends_with("contains leading and/or trailing spaces"));
  CHECK(leading_errors[1].ends_with("does not start with 'order-'"));
  CHECK(leading_errors[2].ends_with("does not follow the syntax '[NAME]-[GUID]' in lower case"));

  const std::string trailing = std::string{kValidOrder} + "\xE3\x80\x80";
  const auto trailing_errors = OrderId::validate(trailing);
  REQUIRE(trailing_errors.size() == 2);
  CHECK(trailing_errors[0].ends_with("contains leading and/or trailing spaces"));
  CHECK(trailing_errors[1].ends_with("does not follow the syntax '[NAME]-[GUID]' in lower case"));
}

TEST_CASE("validate: non-space multi-byte characters are not trimmed",
          "[identity][validation]") {
  // U+00E9 shares its lead byte with U+00A0.
  const auto errors = OrderId::validate(std::string{kValidOrder} + "\xC3\xA9");
  REQUIRE(errors.size() == 1);
  CHECK(errors[0].ends_with("does not follow the syntax '[NAME]-[GUID]' in lower case"));
}

TEST_CASE("validate: another kind's prefix is rejected", "[identity][validation]") {
  const auto errors = OrderId::validate("user-3fa85f64-5717-4562-b3fc-2c963f66afa6");
  REQUIRE(errors.size() == 1);
  CHECK(errors[0] ==
        "Identity 'user-3fa85f64-5717-4562-b3fc-2c963f66afa6' of type 'OrderId' does not start "
        "with 'order-'");
}

TEST_CASE("validate: prefix match is case-sensitive", "[identity][validation]") {
  const auto errors = InvoiceId::validate("Invoice-3fa85f64-5717-4562-b3fc-2c963f66afa6");
  REQUIRE(errors.size() == 1);
  CHECK(errors[0].ends_with("does not start with 'invoice-'"));
}

TEST_CASE("validate: upper-case UUID fails the syntax rule", "[identity][validation]") {
  const auto errors = OrderId::validate("order-3FA85F64-5717-4562-B3FC-2C963F66AFA6");
  REQUIRE(errors.size() == 1);
  CHECK(errors[0].ends_with("does not follow the syntax '[NAME]-[GUID]' in lower case"));
}

TEST_CASE("validate: malformed UUID segments fail the syntax rule", "[identity][validation]") {
  CHECK_FALSE(OrderId::is_valid("order-"));
  CHECK_FALSE(OrderId::is_valid("order-3fa85f64-5717-4562-b3fc-2c963f66afa"));
  CHECK_FALSE(OrderId::is_valid("order-3fa85f64-5717-4562-b3fc-2c963f66afa6a"));
  CHECK_FALSE(OrderId::is_valid("order-3fa85f6457174562b3fc2c963f66afa6"));
  CHECK_FALSE(OrderId::is_valid("order-{3fa85f64-5717-4562-b3fc-2c963f66afa6}"));
  CHECK_FALSE(OrderId::is_valid("order-user-3fa85f64-5717-4562-b3fc-2c963f66afa6"));
  CHECK_FALSE(OrderId::is_valid("order--3fa85f64-5717-4562-b3fc-2c963f66afa6"));
}

TEST_CASE("validate: very long values are rejected without exhausting the stack",
          "[identity][validation]") {
  const std::string body(1'000'000, 'x');

  const auto prefixed = OrderId::validate("order-" + body);
  REQUIRE(prefixed.size() == 1);
  CHECK(prefixed[0].ends_with("does not follow the syntax '[NAME]-[GUID]' in lower case"));

  const auto unprefixed = OrderId::validate(body);
  REQUIRE(unprefixed.size() == 2);
  CHECK(unprefixed[0].ends_with("does not start with 'order-'"));
  CHECK(unprefixed[1].ends_with("does not follow the syntax '[NAME]-[GUID]' in lower case"));

  CHECK_FALSE(OrderId::is_valid(body + "-3fa85f64-5717-4562-b3fc-2c963f66afa6"));
  CHECK_FALSE(OrderId::try_with("order-" + body).has_value());
}

// ── IdentityFormatError ────────────────────────────────────────────────────

TEST_CASE("IdentityFormatError: joins messages with comma separator", "[identity][errors]") {
  const std::vector<std::string> messages = {"first", "second"};
  const IdentityFormatError error(messages);
  CHECK(std::string{error.what()} == "Identity is invalid: first, second");
  CHECK(error.errors() == messages);
}

TEST_CASE("IdentityError: message matches the exception text", "[identity][errors]") {
  const IdentityError error{{"only"}};
  CHECK(error.message() == "Identity is invalid: only");
}
