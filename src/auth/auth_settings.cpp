#include "sg/auth/auth_settings.h"

namespace sg::auth {

std::optional<std::string_view> FindInvariantViolation(const AuthSettings& settings) {
  if (settings.password_hash.has_value() != settings.recovery_key_hash.has_value()) {
    return std::string_view{"password and recovery key hashes must be set together"};
  }
  if (settings.password_hash && settings.password_hash->empty()) {
    return std::string_view{"password hash is empty"};
  }
  if (settings.recovery_key_hash && settings.recovery_key_hash->empty()) {
    return std::string_view{"recovery key hash is empty"};
  }
  if (settings.auto_lock_timeout_seconds == 0) {
    return std::string_view{"auto-lock timeout must be positive"};
  }
  if (!settings.ProtectionEnabled() && (settings.failed_attempts != 0 || settings.lockout_until)) {
    return std::string_view{"lockout state without a configured password"};
  }
  return std::nullopt;
}

std::string_view ToString(SessionState state) noexcept {
  switch (state) {
  case SessionState::kUnlocked:
    return "UNLOCKED";
  case SessionState::kLocked:
    return "LOCKED";
  }
  return "LOCKED";
}

}  // namespace sg::auth
