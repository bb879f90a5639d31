#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "sg/auth/lockout_policy.h"
#include "sg/auth/password_hasher.h"

namespace sg::auth {

struct AuthConfig {
  using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

  int hash_cost{PasswordHasher::kDefaultCost};
  uint32_t lockout_threshold{LockoutConfig::kDefaultThreshold};
  std::chrono::minutes lockout_duration{LockoutConfig::kDefaultDuration};
  std::chrono::seconds idle_check_interval{60};
  std::filesystem::path state_dir;
  bool audit_log_enabled{true};

  [[nodiscard]] std::filesystem::path settings_path() const { return state_dir / "auth.sgs"; }
  [[nodiscard]] std::filesystem::path audit_log_path() const { return state_dir / "audit.log"; }
  [[nodiscard]] LockoutConfig lockout() const {
    return LockoutConfig{lockout_threshold, lockout_duration};
  }

  // Defaults overridden by SG_HASH_COST, SG_LOCKOUT_THRESHOLD,
  // SG_LOCKOUT_MINUTES, SG_IDLE_CHECK_SECONDS and SG_STATE_DIR. The lockout
  // overrides may only tighten the defaults. Throws sg::Error{Config} on
  // malformed or out-of-range values.
  static AuthConfig FromEnvironment(const EnvLookup& lookup = ProcessEnvironment());
  static EnvLookup ProcessEnvironment();
  static std::filesystem::path DefaultStateDir(const EnvLookup& lookup = ProcessEnvironment());

  // Throws sg::Error{Config} when a field is out of range.
  void Validate() const;
};

// Parses a decimal value within [min_value, max_value]; throws
// sg::Error{Config} naming |name| otherwise.
uint64_t ParseConfigNumber(std::string_view name, std::string_view text, uint64_t min_value,
                           uint64_t max_value);

}  // namespace sg::auth
