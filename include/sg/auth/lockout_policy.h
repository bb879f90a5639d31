#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "sg/auth/auth_settings.h"
#include "sg/auth/credential_store.h"

namespace sg::auth {

struct LockoutConfig {
  static constexpr uint32_t kDefaultThreshold = 5;
  static constexpr std::chrono::minutes kDefaultDuration{15};

  uint32_t threshold{kDefaultThreshold};
  std::chrono::seconds duration{kDefaultDuration};
};

struct LockoutDecision {
  uint32_t failed_attempts{0};
  bool locked_out{false};
  std::optional<TimePoint> lockout_until;
  // Failures left before the next lockout; zero once the threshold was hit.
  uint32_t attempts_remaining{0};
};

// Consecutive-failure counter with a persisted lockout expiry.
//
// The counter only resets on a successful verification. Once the threshold
// has been reached, every failure after the lockout expires re-arms a full
// lockout immediately.
class LockoutPolicy {
 public:
  LockoutPolicy(CredentialStore& store, LockoutConfig config, WallClock clock = SystemWallClock());

  // Increments the counter, arms the lockout when the threshold is reached,
  // and persists before returning.
  LockoutDecision RecordFailure();
  void RecordSuccess();

  [[nodiscard]] bool IsLockedOut(TimePoint now);
  // Rounded up to whole seconds; zero when not locked out.
  [[nodiscard]] std::chrono::seconds RemainingLockout(TimePoint now);
  [[nodiscard]] LockoutDecision Current(TimePoint now);

  // Pure transitions used by callers that fold the counter update into a
  // larger commit.
  LockoutDecision ApplyFailure(AuthSettings& settings, TimePoint now) const;
  void ApplySuccess(AuthSettings& settings, TimePoint now) const;
  [[nodiscard]] LockoutDecision Describe(const AuthSettings& settings, TimePoint now) const;

  [[nodiscard]] const LockoutConfig& config() const noexcept { return config_; }
  [[nodiscard]] TimePoint Now() const { return clock_(); }

 private:
  // Clamps a lockout expiry that lies further out than one full duration
  // (wall clock moved backwards). Returns the possibly updated snapshot.
  AuthSettings LoadCheckingSkew(TimePoint now);

  CredentialStore& store_;
  LockoutConfig config_;
  WallClock clock_;
};

}  // namespace sg::auth
