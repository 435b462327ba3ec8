#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace strongid::identity {

// IdentityError carries the validation messages for a rejected identity value.
// Used as the error side of Result<T, IdentityError> by non-throwing entry points.
struct IdentityError {
  std::vector<std::string> errors;  // NOLINT(readability-identifier-naming)

  // message returns "Identity is invalid: " followed by errors joined with ", ".
  [[nodiscard]] std::string message() const;
};

// IdentityFormatError is thrown when an identity is constructed from a value
// that fails validation. what() holds the joined message; errors() holds each
// message in validation order.
class IdentityFormatError : public std::invalid_argument {
 public:
  explicit IdentityFormatError(std::vector<std::string> errors);

  [[nodiscard]] const std::vector<std::string>& errors() const noexcept { return errors_; }

 private:
  std::vector<std::string> errors_;
};

}  // namespace strongid::identity
