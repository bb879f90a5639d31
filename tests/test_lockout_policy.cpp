#include "sg/auth/lockout_policy.h"

#include <atomic>
#include <chrono>

#include "sg/error.h"
#include "sg/orchestrator/event_bus.h"
#include "test_helpers.h"

namespace {

sg::auth::AuthSettings Protected() {
  sg::auth::AuthSettings settings;
  settings.password_hash = "$sg-pbkdf2-sha256$04$pw";
  settings.recovery_key_hash = "$sg-pbkdf2-sha256$04$rk";
  return settings;
}

}  // namespace

int main() {
  using namespace std::chrono_literals;

  sg::testing::FakeWallClock clock;
  sg::auth::MemoryAuthSettingsStore memory(Protected());
  sg::auth::CredentialStore store(memory);
  store.Open();
  sg::auth::LockoutPolicy policy(store, sg::auth::LockoutConfig{5, 15min}, clock.AsFunction());

  // Four failures count down without locking.
  for (uint32_t i = 1; i <= 4; ++i) {
    const auto saves_before = memory.save_count();
    auto decision = policy.RecordFailure();
    SG_EXPECT(memory.save_count() == saves_before + 1, "failure persisted before returning");
    SG_EXPECT(decision.failed_attempts == i, "counter " << i);
    SG_EXPECT(!decision.locked_out, "no lockout before threshold");
    SG_EXPECT(decision.attempts_remaining == 5 - i, "attempts remaining");
  }

  // Fifth failure arms the lockout immediately.
  auto fifth = policy.RecordFailure();
  SG_EXPECT(fifth.locked_out, "threshold reached");
  SG_EXPECT(fifth.attempts_remaining == 0, "no attempts remaining");
  SG_EXPECT(fifth.lockout_until == sg::auth::TruncateToMillis(clock.Now() + 15min),
            "lockout lasts 15 minutes");
  SG_EXPECT(memory.Load()->lockout_until == fifth.lockout_until, "lockout expiry persisted");
  SG_EXPECT(policy.IsLockedOut(clock.Now()), "locked out now");
  SG_EXPECT(policy.RemainingLockout(clock.Now()) == 900s, "full window remaining");

  clock.Advance(14min + 59s + 500ms);
  SG_EXPECT(policy.IsLockedOut(clock.Now()), "still locked before expiry");
  SG_EXPECT(policy.RemainingLockout(clock.Now()) == 1s, "remaining rounds up");

  // After expiry a single failure re-arms a full lockout.
  clock.Advance(1s);
  SG_EXPECT(!policy.IsLockedOut(clock.Now()), "lockout expired");
  SG_EXPECT(store.Snapshot().failed_attempts == 5, "expiry does not reset the counter");
  auto relock = policy.RecordFailure();
  SG_EXPECT(relock.locked_out, "post-expiry failure relocks");
  SG_EXPECT(relock.failed_attempts == 6, "counter keeps growing");
  SG_EXPECT(policy.RemainingLockout(clock.Now()) == 900s, "fresh full window");

  // Success clears everything; a later failure starts at 1.
  clock.Advance(15min);
  policy.RecordSuccess();
  auto after_success = store.Snapshot();
  SG_EXPECT(after_success.failed_attempts == 0, "success resets counter");
  SG_EXPECT(!after_success.lockout_until, "success clears lockout");
  SG_EXPECT(after_success.last_success_at == sg::auth::TruncateToMillis(clock.Now()),
            "success time recorded");
  SG_EXPECT(policy.RecordFailure().failed_attempts == 1, "fresh count after success");

  // Success after fewer than five failures.
  policy.RecordFailure();
  policy.RecordFailure();
  policy.RecordSuccess();
  SG_EXPECT(policy.RecordFailure().failed_attempts == 1, "count restarts at 1, not N+1");
  policy.RecordSuccess();

  // Wall clock moved backwards: lockout stays in force, clamped to one window.
  std::atomic<int> skew_events{0};
  const auto sub = sg::orchestrator::EventBus::Instance().Subscribe(
      [&](const sg::orchestrator::Event& event) {
        if (event.event_id == "lockout_clock_skew") {
          skew_events.fetch_add(1);
        }
      });
  for (int i = 0; i < 5; ++i) {
    policy.RecordFailure();
  }
  clock.Advance(-2h);
  SG_EXPECT(policy.IsLockedOut(clock.Now()), "rollback keeps the lockout");
  SG_EXPECT(skew_events.load() == 1, "skew reported once");
  SG_EXPECT(policy.RemainingLockout(clock.Now()) == 900s, "clamped to one window");
  SG_EXPECT(store.Snapshot().lockout_until == sg::auth::TruncateToMillis(clock.Now() + 15min),
            "clamp persisted");

  // A policy built with a shorter window keeps a lockout armed under the
  // default one.
  {
    sg::auth::LockoutPolicy short_window(store, sg::auth::LockoutConfig{5, 1min},
                                         clock.AsFunction());
    const auto armed_until = store.Snapshot().lockout_until;
    const int skew_before = skew_events.load();
    SG_EXPECT(short_window.IsLockedOut(clock.Now()), "still locked under a shorter window");
    SG_EXPECT(short_window.RemainingLockout(clock.Now()) == 900s, "lockout not shortened");
    SG_EXPECT(store.Snapshot().lockout_until == armed_until, "persisted expiry untouched");
    SG_EXPECT(skew_events.load() == skew_before, "no skew reported within the default window");

    clock.Advance(-1h);
    SG_EXPECT(short_window.RemainingLockout(clock.Now()) == 900s,
              "rollback clamps to the default window");
    SG_EXPECT(skew_events.load() == skew_before + 1, "rollback still reported");
  }
  sg::orchestrator::EventBus::Instance().Unsubscribe(sub);

  // Pure transitions leave persistence to the caller.
  sg::auth::AuthSettings scratch = Protected();
  const auto saves = memory.save_count();
  auto pure = policy.ApplyFailure(scratch, clock.Now());
  SG_EXPECT(pure.failed_attempts == 1 && scratch.failed_attempts == 1, "pure failure");
  SG_EXPECT(memory.save_count() == saves, "pure failure does not persist");

  bool threw = false;
  try {
    sg::auth::LockoutPolicy invalid(store, sg::auth::LockoutConfig{0, 15min});
  } catch (const sg::Error&) {
    threw = true;
  }
  SG_EXPECT(threw, "zero threshold rejected");

  std::cout << "lockout policy tests ok\n";
  return 0;
}
