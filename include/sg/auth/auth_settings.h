#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sg::auth {

using TimePoint = std::chrono::system_clock::time_point;
// Wall-clock source. Injected so lockout expiry can be simulated.
using WallClock = std::function<TimePoint()>;

inline WallClock SystemWallClock() {
  return [] { return std::chrono::system_clock::now(); };
}

// Persisted timestamps have millisecond resolution.
inline TimePoint TruncateToMillis(TimePoint tp) {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
}

inline constexpr uint32_t kDefaultAutoLockTimeoutSeconds = 1800;

// The single persisted authentication record.
struct AuthSettings {
  std::optional<std::string> password_hash;
  std::optional<std::string> recovery_key_hash;
  uint32_t failed_attempts{0};
  std::optional<TimePoint> lockout_until;
  bool auto_lock_enabled{false};
  uint32_t auto_lock_timeout_seconds{kDefaultAutoLockTimeoutSeconds};
  bool os_lock_integration_enabled{true};
  std::optional<TimePoint> last_success_at;

  [[nodiscard]] bool ProtectionEnabled() const noexcept { return password_hash.has_value(); }

  bool operator==(const AuthSettings&) const = default;
};

// Returns a description of the first violated record invariant, if any.
std::optional<std::string_view> FindInvariantViolation(const AuthSettings& settings);

enum class SessionState { kUnlocked, kLocked };

std::string_view ToString(SessionState state) noexcept;

}  // namespace sg::auth
