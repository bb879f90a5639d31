#pragma once

#include <cstddef>
#include <string_view>

namespace sg::auth {

inline constexpr std::size_t kMinPasswordLen = 8;
inline constexpr std::size_t kMaxPasswordLen = 1024;

// Throws sg::Error{Validation, errors::validation::kPasswordPolicy}.
void EnforcePasswordPolicy(std::string_view password);

struct PasswordStrength {
  int score{0};  // 0 (rejected) .. 4 (very strong)
  std::string_view label;
};

// Advisory feedback only; EnforcePasswordPolicy is the acceptance rule.
PasswordStrength EvaluatePasswordStrength(std::string_view password) noexcept;

}  // namespace sg::auth
