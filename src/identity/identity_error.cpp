#include "strongid/identity/identity_error.h"

#include <utility>

namespace strongid::identity {

namespace {

std::string join_errors(const std::vector<std::string>& errors) {
  std::string out = "Identity is invalid: ";
  for (std::size_t i = 0; i < errors.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += errors[i];
  }
  return out;
}

}  // namespace

std::string IdentityError::message() const {
  return join_errors(errors);
}

IdentityFormatError::IdentityFormatError(std::vector<std::string> errors)
    : std::invalid_argument(join_errors(errors)), errors_(std::move(errors)) {}

}  // namespace strongid::identity
