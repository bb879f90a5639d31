#include "sg/auth/lockout_policy.h"

#include <algorithm>
#include <string>

#include "sg/error.h"
#include "sg/orchestrator/event_bus.h"

namespace sg::auth {
namespace {

void PublishClockSkew(std::chrono::milliseconds ahead_by) {
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kSecurity;
  event.severity = orchestrator::EventSeverity::kWarning;
  event.event_id = "lockout_clock_skew";
  event.message = "Lockout expiry lies beyond one lockout window; wall clock moved backwards";
  event.fields.emplace_back("ahead_ms", std::to_string(ahead_by.count()),
                            orchestrator::FieldPrivacy::kPublic, true);
  orchestrator::EventBus::Instance().Publish(event);
}

}  // namespace

LockoutPolicy::LockoutPolicy(CredentialStore& store, LockoutConfig config, WallClock clock)
    : store_(store), config_(config), clock_(std::move(clock)) {
  if (config_.threshold == 0 || config_.duration <= std::chrono::seconds::zero()) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                "Lockout threshold and duration must be positive");
  }
  if (!clock_) {
    clock_ = SystemWallClock();
  }
}

LockoutDecision LockoutPolicy::Describe(const AuthSettings& settings, TimePoint now) const {
  LockoutDecision decision;
  decision.failed_attempts = settings.failed_attempts;
  decision.lockout_until = settings.lockout_until;
  decision.locked_out = settings.lockout_until.has_value() && now < *settings.lockout_until;
  decision.attempts_remaining =
      settings.failed_attempts >= config_.threshold ? 0 : config_.threshold - settings.failed_attempts;
  return decision;
}

LockoutDecision LockoutPolicy::ApplyFailure(AuthSettings& settings, TimePoint now) const {
  if (settings.failed_attempts < UINT32_MAX) {
    ++settings.failed_attempts;
  }
  if (settings.failed_attempts >= config_.threshold) {
    settings.lockout_until = TruncateToMillis(now + config_.duration);
  }
  return Describe(settings, now);
}

void LockoutPolicy::ApplySuccess(AuthSettings& settings, TimePoint now) const {
  settings.failed_attempts = 0;
  settings.lockout_until.reset();
  settings.last_success_at = TruncateToMillis(now);
}

AuthSettings LockoutPolicy::LoadCheckingSkew(TimePoint now) {
  AuthSettings settings = store_.Snapshot();
  if (!settings.lockout_until || store_.corrupt()) {
    return settings;
  }
  // A shorter configured window never shortens a lockout armed under the
  // default one.
  const std::chrono::seconds window =
      std::max<std::chrono::seconds>(config_.duration, LockoutConfig::kDefaultDuration);
  const auto ahead = *settings.lockout_until - now;
  if (ahead > window) {
    PublishClockSkew(std::chrono::duration_cast<std::chrono::milliseconds>(ahead));
    settings.lockout_until = TruncateToMillis(now + window);
    store_.Commit(settings);
  }
  return settings;
}

LockoutDecision LockoutPolicy::RecordFailure() {
  const TimePoint now = clock_();
  AuthSettings settings = LoadCheckingSkew(now);
  LockoutDecision decision = ApplyFailure(settings, now);
  store_.Commit(settings);
  return decision;
}

void LockoutPolicy::RecordSuccess() {
  AuthSettings settings = store_.Snapshot();
  ApplySuccess(settings, clock_());
  store_.Commit(settings);
}

bool LockoutPolicy::IsLockedOut(TimePoint now) {
  return Current(now).locked_out;
}

std::chrono::seconds LockoutPolicy::RemainingLockout(TimePoint now) {
  const LockoutDecision decision = Current(now);
  if (!decision.locked_out) {
    return std::chrono::seconds::zero();
  }
  return std::chrono::ceil<std::chrono::seconds>(*decision.lockout_until - now);
}

LockoutDecision LockoutPolicy::Current(TimePoint now) {
  return Describe(LoadCheckingSkew(now), now);
}

}  // namespace sg::auth
