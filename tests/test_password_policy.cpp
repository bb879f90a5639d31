#include "sg/auth/password_policy.h"

#include <string>

#include "sg/error.h"
#include "test_helpers.h"

namespace {

bool Rejected(std::string_view password) {
  try {
    sg::auth::EnforcePasswordPolicy(password);
  } catch (const sg::Error& err) {
    return err.domain == sg::ErrorDomain::Validation &&
           err.code == sg::errors::validation::kPasswordPolicy;
  }
  return false;
}

}  // namespace

int main() {
  SG_EXPECT(Rejected(""), "empty password");
  SG_EXPECT(Rejected("1234567"), "7 characters");
  SG_EXPECT(!Rejected("12345678"), "8 characters accepted");
  SG_EXPECT(!Rejected(std::string(1024, 'x')), "1024 bytes accepted");
  SG_EXPECT(Rejected(std::string(1025, 'x')), "1025 bytes");

  using sg::auth::EvaluatePasswordStrength;
  SG_EXPECT(EvaluatePasswordStrength("abc").score == 0, "too short scores 0");
  SG_EXPECT(EvaluatePasswordStrength("abcdefgh").score == 1, "lowercase only is weak");
  SG_EXPECT(EvaluatePasswordStrength("abcdefG1").score == 2, "mixed short is medium");
  SG_EXPECT(EvaluatePasswordStrength("abcdefghiJK1").score == 3, "long mixed is strong");
  SG_EXPECT(EvaluatePasswordStrength("abcdefghiJK1!").score == 4, "long mixed with symbol");
  SG_EXPECT(EvaluatePasswordStrength("abcdefghiJK1!").label == "very strong", "label");

  std::cout << "password policy tests ok\n";
  return 0;
}
