#include "sg/auth/session_state_machine.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "sg/error.h"
#include "test_helpers.h"

namespace {

using namespace std::chrono_literals;
using sg::auth::AuthOutcome;
using sg::auth::SessionState;
using sg::auth::TransitionCause;

constexpr std::string_view kPassword = "correct horse battery";
constexpr std::string_view kNewPassword = "tr0ub4dor & three";

template <typename Fn>
std::optional<sg::Error> CaptureError(Fn&& fn) {
  try {
    fn();
  } catch (const sg::Error& err) {
    return err;
  }
  return std::nullopt;
}

bool WaitForState(const sg::auth::SessionStateMachine& machine, SessionState expected,
                  std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (machine.State() != expected) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

class TransitionLog {
 public:
  void Record(const sg::auth::SessionTransition& transition) {
    std::lock_guard<std::mutex> guard(mutex_);
    transitions_.push_back(transition);
  }
  std::vector<sg::auth::SessionTransition> Take() {
    std::lock_guard<std::mutex> guard(mutex_);
    auto out = std::move(transitions_);
    transitions_.clear();
    return out;
  }

 private:
  std::mutex mutex_;
  std::vector<sg::auth::SessionTransition> transitions_;
};

struct Fixture {
  sg::testing::FakeWallClock wall;
  sg::testing::FakeSteadyClock steady;
  sg::auth::PasswordHasher hasher{4};

  sg::auth::SessionOptions Options() {
    sg::auth::SessionOptions options;
    options.lockout = sg::auth::LockoutConfig{5, 15min};
    options.idle_check_interval = 5ms;
    options.wall_clock = wall.AsFunction();
    options.idle_clock = steady.AsFunction();
    return options;
  }
};

int TestLockoutScenario() {
  Fixture fx;
  sg::auth::MemoryAuthSettingsStore memory;
  sg::auth::CredentialStore store(memory);
  sg::auth::SessionStateMachine machine(store, fx.hasher, fx.Options());
  SG_EXPECT(machine.State() == SessionState::kUnlocked, "unprotected store starts unlocked");

  auto key = machine.SetupPassword(kPassword);
  SG_EXPECT(!key.Plaintext().empty(), "recovery key shown once");
  SG_EXPECT(machine.Status().protection_enabled, "protection enabled");
  SG_EXPECT(machine.Logout().changed, "logout locks");
  SG_EXPECT(machine.State() == SessionState::kLocked, "locked");

  for (const char* guess : {"a", "b", "c", "d", "e"}) {
    auto result = machine.Login(guess);
    SG_EXPECT(result.outcome == AuthOutcome::kInvalidCredential, "guess " << guess << " rejected");
  }
  SG_EXPECT(machine.Status().failed_attempts == 5, "five failures counted");
  SG_EXPECT(machine.Status().remaining_lockout == 900s, "lockout armed by fifth failure");

  auto sixth = machine.Login("f");
  SG_EXPECT(sixth.outcome == AuthOutcome::kLockedOut, "sixth attempt locked out");
  SG_EXPECT(sixth.retry_after == 900s, "retry after full window");
  auto correct_while_locked = machine.Login(kPassword);
  SG_EXPECT(correct_while_locked.outcome == AuthOutcome::kLockedOut,
            "correct password refused during lockout");
  SG_EXPECT(machine.Status().failed_attempts == 5, "locked-out attempts are not counted");

  fx.wall.Advance(15min);
  auto success = machine.Login(kPassword);
  SG_EXPECT(success.ok(), "correct password after expiry");
  SG_EXPECT(machine.State() == SessionState::kUnlocked, "unlocked");
  SG_EXPECT(machine.Status().failed_attempts == 0, "counter reset");
  SG_EXPECT(machine.Status().last_success_at == sg::auth::TruncateToMillis(fx.wall.Now()),
            "success time recorded");

  // Fewer failures than the threshold, then success: the count restarts.
  machine.Logout();
  machine.Login("wrong-1");
  machine.Login("wrong-2");
  SG_EXPECT(machine.Login(kPassword).ok(), "success below threshold");
  machine.Logout();
  auto after = machine.Login("wrong-3");
  SG_EXPECT(after.lockout.failed_attempts == 1, "count restarted at 1");
  SG_EXPECT(after.lockout.attempts_remaining == 4, "four attempts remain");

  // Already unlocked: success without another transition.
  SG_EXPECT(machine.Login(kPassword).ok(), "unlock");
  TransitionLog log;
  const auto id = machine.Subscribe([&](const auto& t) { log.Record(t); });
  SG_EXPECT(machine.Login("anything").ok(), "login while unlocked is a no-op success");
  SG_EXPECT(log.Take().empty(), "no transition while already unlocked");
  machine.Unsubscribe(id);
  return 0;
}

int TestRestartPersistence() {
  Fixture fx;
  sg::testing::TempDir dir("sg_state_machine_");
  const auto path = dir.path() / "auth.sgs";
  {
    sg::auth::FileAuthSettingsStore file(path);
    sg::auth::CredentialStore store(file);
    sg::auth::SessionStateMachine machine(store, fx.hasher, fx.Options());
    machine.SetupPassword(kPassword);
    machine.ConfigureAutoLock(true, 120);
    machine.Logout();
    for (int i = 0; i < 3; ++i) {
      machine.Login("nope");
    }
  }
  sg::auth::FileAuthSettingsStore file(path);
  sg::auth::CredentialStore store(file);
  sg::auth::SessionStateMachine machine(store, fx.hasher, fx.Options());
  auto status = machine.Status();
  SG_EXPECT(status.state == SessionState::kLocked, "restart starts locked");
  SG_EXPECT(status.failed_attempts == 3, "failure count survives restart");
  SG_EXPECT(status.auto_lock_enabled && status.auto_lock_timeout_seconds == 120,
            "auto-lock settings survive restart");
  machine.Login("nope");
  machine.Login("nope");
  SG_EXPECT(machine.Status().remaining_lockout == 900s, "threshold counts across restarts");
  return 0;
}

int TestRestartMidLockout() {
  Fixture fx;
  sg::testing::TempDir dir("sg_state_machine_lockout_");
  const auto path = dir.path() / "auth.sgs";
  {
    sg::auth::FileAuthSettingsStore file(path);
    sg::auth::CredentialStore store(file);
    sg::auth::SessionStateMachine machine(store, fx.hasher, fx.Options());
    machine.SetupPassword(kPassword);
    machine.Logout();
    for (int i = 0; i < 5; ++i) {
      machine.Login("nope");
    }
    SG_EXPECT(machine.Status().remaining_lockout == 900s, "locked out before restart");
  }
  {
    sg::auth::FileAuthSettingsStore file(path);
    sg::auth::CredentialStore store(file);
    sg::auth::SessionStateMachine machine(store, fx.hasher, fx.Options());
    SG_EXPECT(machine.State() == SessionState::kLocked, "restart starts locked");
    auto first = machine.Login(kPassword);
    SG_EXPECT(first.outcome == AuthOutcome::kLockedOut, "first attempt after restart locked out");
    SG_EXPECT(first.retry_after == 900s, "full window remains after restart");
    SG_EXPECT(machine.Status().failed_attempts == 5, "refused attempt not counted");
  }

  // The expiry is absolute: time spent down counts against it, and a host
  // restarted with a shorter window still honours it.
  fx.wall.Advance(5min);
  {
    sg::auth::FileAuthSettingsStore file(path);
    sg::auth::CredentialStore store(file);
    auto options = fx.Options();
    options.lockout = sg::auth::LockoutConfig{5, 1min};
    sg::auth::SessionStateMachine machine(store, fx.hasher, options);
    auto later = machine.Login(kPassword);
    SG_EXPECT(later.outcome == AuthOutcome::kLockedOut, "still locked after a later restart");
    SG_EXPECT(later.retry_after == 600s, "remaining window counts down across restarts");
  }
  fx.wall.Advance(10min);
  sg::auth::FileAuthSettingsStore file(path);
  sg::auth::CredentialStore store(file);
  sg::auth::SessionStateMachine machine(store, fx.hasher, fx.Options());
  SG_EXPECT(machine.Login(kPassword).ok(), "correct password accepted once the window expires");
  return 0;
}

int TestLockRequests() {
  Fixture fx;
  sg::auth::MemoryAuthSettingsStore memory;
  sg::auth::CredentialStore store(memory);
  sg::auth::SessionStateMachine machine(store, fx.hasher, fx.Options());
  machine.SetupPassword(kPassword);

  TransitionLog log;
  machine.Subscribe([&](const auto& t) { log.Record(t); });

  // OS session event locks within 100 ms.
  sg::auth::QueuedSessionEventSource source;
  machine.AttachSessionEventSource(source);
  source.Deliver(sg::auth::SessionEventKind::kScreenLocked);
  SG_EXPECT(WaitForState(machine, SessionState::kLocked, 100ms), "OS event locked the session");
  auto seen = log.Take();
  SG_EXPECT(seen.size() == 1 && seen[0].cause == TransitionCause::kOsEvent && seen[0].changed,
            "OS event transition");
  SG_EXPECT(seen[0].os_event == sg::auth::SessionEventKind::kScreenLocked, "event kind reported");

  // A second event while locked is an idempotent no-op.
  const auto seq = machine.RequestLock(sg::auth::LockSource::kOsEvent,
                                       sg::auth::SessionEventKind::kSleepOrHibernate);
  SG_EXPECT(machine.WaitUntilProcessed(seq, 100ms), "request processed");
  seen = log.Take();
  SG_EXPECT(seen.size() == 1 && !seen[0].changed, "lock while locked changes nothing");
  SG_EXPECT(machine.State() == SessionState::kLocked, "still locked");

  // Integration disabled: events are ignored.
  SG_EXPECT(machine.Login(kPassword).ok(), "unlock");
  machine.ConfigureOsLockIntegration(false);
  source.Deliver(sg::auth::SessionEventKind::kUserSwitched);
  std::this_thread::sleep_for(20ms);
  SG_EXPECT(machine.State() == SessionState::kUnlocked, "disabled integration does not lock");
  machine.ConfigureOsLockIntegration(true);
  machine.DetachSessionEventSource();
  log.Take();

  // A lock raised while a login resolves is applied right after it.
  machine.Logout();
  std::atomic<uint64_t> raised{0};
  const auto racer = machine.Subscribe([&](const sg::auth::SessionTransition& t) {
    if (t.cause == TransitionCause::kLoginSuccess && raised.load() == 0) {
      raised.store(machine.RequestLock(sg::auth::LockSource::kManual));
    }
  });
  SG_EXPECT(machine.Login(kPassword).ok(), "login succeeded");
  SG_EXPECT(raised.load() != 0, "lock raised during login");
  SG_EXPECT(machine.WaitUntilProcessed(raised.load(), 1s), "queued lock applied");
  SG_EXPECT(machine.State() == SessionState::kLocked, "lock after login wins");
  machine.Unsubscribe(racer);
  seen = log.Take();
  SG_EXPECT(seen.size() >= 3, "logout, unlock and lock observed");
  SG_EXPECT(seen[seen.size() - 2].cause == TransitionCause::kLoginSuccess, "unlock first");
  SG_EXPECT(seen.back().cause == TransitionCause::kManualLogout && seen.back().changed,
            "then the queued lock");

  // Observer failures are reported and do not block later observers.
  int later_calls = 0;
  const auto bad = machine.Subscribe([](const auto&) { throw std::runtime_error("observer bug"); });
  const auto good = machine.Subscribe([&](const auto&) { ++later_calls; });
  SG_EXPECT(machine.Login(kPassword).ok(), "login despite failing observer");
  SG_EXPECT(later_calls == 1, "later observer still called");
  machine.Unsubscribe(bad);
  machine.Unsubscribe(good);
  return 0;
}

int TestIdleLock() {
  Fixture fx;
  sg::auth::MemoryAuthSettingsStore memory;
  sg::auth::CredentialStore store(memory);
  sg::auth::SessionStateMachine machine(store, fx.hasher, fx.Options());
  machine.SetupPassword(kPassword);

  auto zero = CaptureError([&] { machine.ConfigureAutoLock(true, 0); });
  SG_EXPECT(zero && zero->domain == sg::ErrorDomain::Config, "zero timeout rejected");

  machine.ConfigureAutoLock(true, 5);
  fx.steady.Advance(4s);
  machine.NotifyActivity();
  fx.steady.Advance(4s);
  SG_EXPECT(!machine.CheckIdle(), "activity postponed the idle lock");
  fx.steady.Advance(2s);
  SG_EXPECT(machine.CheckIdle(), "idle lock requested");
  SG_EXPECT(WaitForState(machine, SessionState::kLocked, 100ms), "idle timeout locked");
  SG_EXPECT(!machine.CheckIdle(), "monitor disarmed while locked");

  // Background checks drive the same path.
  SG_EXPECT(machine.Login(kPassword).ok(), "unlock");
  machine.StartIdleChecks();
  fx.steady.Advance(6s);
  SG_EXPECT(WaitForState(machine, SessionState::kLocked, 1s), "periodic check locked");
  machine.StopIdleChecks();

  // Disabled auto-lock never fires.
  SG_EXPECT(machine.Login(kPassword).ok(), "unlock again");
  machine.ConfigureAutoLock(false, 5);
  fx.steady.Advance(1h);
  SG_EXPECT(!machine.CheckIdle(), "disabled auto-lock");
  SG_EXPECT(machine.State() == SessionState::kUnlocked, "still unlocked");
  return 0;
}

int TestCredentialManagement() {
  Fixture fx;
  sg::auth::MemoryAuthSettingsStore memory;
  sg::auth::CredentialStore store(memory);
  sg::auth::SessionStateMachine machine(store, fx.hasher, fx.Options());

  auto weak = CaptureError([&] { machine.SetupPassword("short"); });
  SG_EXPECT(weak && weak->code == sg::errors::validation::kPasswordPolicy, "policy enforced");
  auto first_key = machine.SetupPassword(kPassword);
  auto again = CaptureError([&] { machine.SetupPassword(kNewPassword); });
  SG_EXPECT(again && again->code == sg::errors::auth::kCredentialAlreadySet, "setup only once");

  // Wrong current password: rejected, counted, session stays unlocked.
  auto rejected = machine.ChangePassword("wrong password", kNewPassword);
  SG_EXPECT(rejected.result.outcome == AuthOutcome::kInvalidCredential, "change rejected");
  SG_EXPECT(!rejected.recovery_key, "no key on rejection");
  SG_EXPECT(machine.Status().failed_attempts == 1, "rejected change counted");
  SG_EXPECT(machine.State() == SessionState::kUnlocked, "still unlocked");

  auto changed = machine.ChangePassword(kPassword, kNewPassword);
  SG_EXPECT(changed.result.ok() && changed.recovery_key, "password changed");
  SG_EXPECT(changed.recovery_key->Plaintext() != first_key.Plaintext(), "recovery key rotated");
  SG_EXPECT(machine.Status().failed_attempts == 0, "success resets counter");

  machine.Logout();
  SG_EXPECT(machine.Login(kPassword).outcome == AuthOutcome::kInvalidCredential, "old password gone");
  SG_EXPECT(machine.BeginRecovery(first_key.Plaintext()).result.outcome ==
                AuthOutcome::kInvalidCredential,
            "old recovery key gone");
  SG_EXPECT(machine.Login(kNewPassword).ok(), "new password works");

  auto locked_change = CaptureError([&] {
    machine.Logout();
    machine.ChangePassword(kNewPassword, kPassword);
  });
  SG_EXPECT(locked_change && locked_change->code == sg::errors::auth::kSessionLocked,
            "changes require an unlocked session");
  SG_EXPECT(machine.Login(kNewPassword).ok(), "unlock");

  SG_EXPECT(machine.DisableProtection("wrong password").outcome == AuthOutcome::kInvalidCredential,
            "disable needs the password");
  SG_EXPECT(machine.DisableProtection(kNewPassword).ok(), "protection disabled");
  SG_EXPECT(!machine.Status().protection_enabled, "no credential");
  machine.Logout();
  SG_EXPECT(machine.Login("").ok(), "unprotected login always succeeds");
  return 0;
}

int TestRecovery() {
  Fixture fx;
  sg::auth::MemoryAuthSettingsStore memory;
  sg::auth::CredentialStore store(memory);
  sg::auth::SessionStateMachine machine(store, fx.hasher, fx.Options());
  auto key = machine.SetupPassword(kPassword);
  machine.Logout();

  auto bad = machine.BeginRecovery("AAAA-AAAA-AAAA-AAAA");
  SG_EXPECT(bad.result.outcome == AuthOutcome::kInvalidCredential && !bad.ticket, "wrong key");
  SG_EXPECT(machine.Status().failed_attempts == 1, "recovery failures count toward lockout");

  auto redemption = machine.BeginRecovery(key.Plaintext());
  SG_EXPECT(redemption.result.ok() && redemption.ticket, "ticket issued");
  SG_EXPECT(machine.State() == SessionState::kLocked, "redemption alone does not unlock");

  auto weak = CaptureError([&] { machine.CompleteRecovery(*redemption.ticket, "short"); });
  SG_EXPECT(weak && weak->domain == sg::ErrorDomain::Validation, "policy checked first");
  SG_EXPECT(!redemption.ticket->empty(), "ticket still usable after policy failure");

  auto replacement = machine.CompleteRecovery(*redemption.ticket, kNewPassword);
  SG_EXPECT(redemption.ticket->empty(), "ticket consumed");
  SG_EXPECT(machine.State() == SessionState::kUnlocked, "recovery unlocks");
  SG_EXPECT(machine.Status().failed_attempts == 0, "recovery resets counter");
  SG_EXPECT(replacement.Plaintext() != key.Plaintext(), "new recovery key");

  auto reused = CaptureError([&] { machine.CompleteRecovery(*redemption.ticket, kPassword); });
  SG_EXPECT(reused && reused->code == sg::errors::auth::kResetTicketInvalid, "ticket single use");

  // A credential change invalidates outstanding tickets.
  machine.Logout();
  auto stale = machine.BeginRecovery(replacement.Plaintext());
  SG_EXPECT(stale.ticket, "second ticket");
  SG_EXPECT(machine.Login(kNewPassword).ok(), "unlock");
  auto rotated = machine.ChangePassword(kNewPassword, kPassword);
  SG_EXPECT(rotated.result.ok(), "changed");
  auto invalidated = CaptureError([&] { machine.CompleteRecovery(*stale.ticket, kNewPassword); });
  SG_EXPECT(invalidated && invalidated->domain == sg::ErrorDomain::Security,
            "ticket invalid after credential change");

  // Recovery is subject to the lockout too.
  machine.Logout();
  for (int i = 0; i < 5; ++i) {
    machine.Login("wrong");
  }
  auto gated = machine.BeginRecovery(rotated.recovery_key->Plaintext());
  SG_EXPECT(gated.result.outcome == AuthOutcome::kLockedOut && !gated.ticket, "recovery locked out");
  return 0;
}

int TestCorruptStore() {
  Fixture fx;
  sg::auth::AuthSettings settings;
  settings.password_hash = fx.hasher.Hash(kPassword);
  settings.recovery_key_hash = fx.hasher.Hash("ABCD-EFGH-JKLM-NPQR");
  sg::auth::MemoryAuthSettingsStore memory(settings);
  memory.MarkCorrupt();
  sg::auth::CredentialStore store(memory);
  sg::auth::SessionStateMachine machine(store, fx.hasher, fx.Options());

  SG_EXPECT(machine.State() == SessionState::kLocked, "corrupt store starts locked");
  SG_EXPECT(machine.Status().corrupt_store, "corruption reported");
  SG_EXPECT(machine.Login(kPassword).outcome == AuthOutcome::kCorruptStore, "login refused");
  SG_EXPECT(machine.BeginRecovery("ABCD-EFGH-JKLM-NPQR").result.outcome ==
                AuthOutcome::kCorruptStore,
            "recovery refused");
  auto setup = CaptureError([&] { machine.SetupPassword(kNewPassword); });
  SG_EXPECT(setup && setup->code == sg::errors::auth::kCorruptStore, "setup refused");
  SG_EXPECT(memory.save_count() == 0, "corrupt record never overwritten");
  return 0;
}

}  // namespace

int main() {
  if (int rc = TestLockoutScenario()) return rc;
  if (int rc = TestRestartPersistence()) return rc;
  if (int rc = TestRestartMidLockout()) return rc;
  if (int rc = TestLockRequests()) return rc;
  if (int rc = TestIdleLock()) return rc;
  if (int rc = TestCredentialManagement()) return rc;
  if (int rc = TestRecovery()) return rc;
  if (int rc = TestCorruptStore()) return rc;
  std::cout << "session state machine tests ok\n";
  return 0;
}
