#include "sg/auth/password_policy.h"

#include <cctype>
#include <string>

#include "sg/error.h"
#include "sg/errors.h"

namespace sg::auth {

void EnforcePasswordPolicy(std::string_view password) {
  if (password.size() < kMinPasswordLen) {
    throw Error(ErrorDomain::Validation, errors::validation::kPasswordPolicy,
                std::string(errors::msg::kPasswordTooShort));
  }
  if (password.size() > kMaxPasswordLen) {
    throw Error(ErrorDomain::Validation, errors::validation::kPasswordPolicy,
                std::string(errors::msg::kPasswordTooLong));
  }
}

PasswordStrength EvaluatePasswordStrength(std::string_view password) noexcept {
  if (password.size() < kMinPasswordLen) {
    return {0, "too short"};
  }
  bool has_lower = false;
  bool has_upper = false;
  bool has_digit = false;
  bool has_punct = false;
  for (unsigned char ch : password) {
    has_lower |= std::islower(ch) != 0;
    has_upper |= std::isupper(ch) != 0;
    has_digit |= std::isdigit(ch) != 0;
    has_punct |= std::ispunct(ch) != 0;
  }
  // Half points are kept as integers (x2).
  int doubled = password.size() >= 12 ? 2 : 1;
  doubled += has_lower ? 1 : 0;
  doubled += has_upper ? 1 : 0;
  doubled += has_digit ? 1 : 0;
  doubled += has_punct ? 2 : 0;
  if (doubled >= 7) {
    return {4, "very strong"};
  }
  if (doubled >= 5) {
    return {3, "strong"};
  }
  if (doubled >= 3) {
    return {2, "medium"};
  }
  return {1, "weak"};
}

}  // namespace sg::auth
