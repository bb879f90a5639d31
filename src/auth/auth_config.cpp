#include "sg/auth/auth_config.h"

#include <charconv>
#include <cstdlib>

#include "sg/error.h"
#include "sg/errors.h"

namespace sg::auth {

uint64_t ParseConfigNumber(std::string_view name, std::string_view text, uint64_t min_value,
                           uint64_t max_value) {
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size() || value < min_value ||
      value > max_value) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                std::string(name) + " must be an integer in [" + std::to_string(min_value) + ", " +
                    std::to_string(max_value) + "], got '" + std::string(text) + "'");
  }
  return value;
}

AuthConfig::EnvLookup AuthConfig::ProcessEnvironment() {
  return [](std::string_view name) -> std::optional<std::string> {
    const char* value = std::getenv(std::string(name).c_str());
    if (!value) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

std::filesystem::path AuthConfig::DefaultStateDir(const EnvLookup& lookup) {
  if (auto xdg = lookup("XDG_STATE_HOME"); xdg && !xdg->empty()) {
    return std::filesystem::path(*xdg) / "sessiongate";
  }
  if (auto home = lookup("HOME"); home && !home->empty()) {
    return std::filesystem::path(*home) / ".local" / "state" / "sessiongate";
  }
  return std::filesystem::path(".sessiongate");
}

AuthConfig AuthConfig::FromEnvironment(const EnvLookup& lookup) {
  AuthConfig config;
  if (auto v = lookup("SG_HASH_COST")) {
    config.hash_cost = static_cast<int>(ParseConfigNumber(
        "SG_HASH_COST", *v, PasswordHasher::kMinCost, PasswordHasher::kMaxCost));
  }
  if (auto v = lookup("SG_LOCKOUT_THRESHOLD")) {
    config.lockout_threshold =
        static_cast<uint32_t>(ParseConfigNumber("SG_LOCKOUT_THRESHOLD", *v, 1,
                                                LockoutConfig::kDefaultThreshold));
  }
  if (auto v = lookup("SG_LOCKOUT_MINUTES")) {
    config.lockout_duration =
        std::chrono::minutes(ParseConfigNumber("SG_LOCKOUT_MINUTES", *v,
                                               LockoutConfig::kDefaultDuration.count(),
                                               7 * 24 * 60));
  }
  if (auto v = lookup("SG_IDLE_CHECK_SECONDS")) {
    config.idle_check_interval =
        std::chrono::seconds(ParseConfigNumber("SG_IDLE_CHECK_SECONDS", *v, 1, 3600));
  }
  if (auto v = lookup("SG_STATE_DIR"); v && !v->empty()) {
    config.state_dir = *v;
  } else {
    config.state_dir = DefaultStateDir(lookup);
  }
  config.Validate();
  return config;
}

void AuthConfig::Validate() const {
  if (hash_cost < PasswordHasher::kMinCost || hash_cost > PasswordHasher::kMaxCost) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                std::string(errors::msg::kHashCostOutOfRange));
  }
  if (lockout_threshold == 0 || lockout_duration <= std::chrono::minutes::zero() ||
      idle_check_interval <= std::chrono::seconds::zero()) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                "Lockout and idle check values must be positive");
  }
  if (state_dir.empty()) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue, "State directory is empty");
  }
}

}  // namespace sg::auth
