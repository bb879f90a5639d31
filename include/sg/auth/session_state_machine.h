#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "sg/auth/auth_settings.h"
#include "sg/auth/credential_store.h"
#include "sg/auth/idle_monitor.h"
#include "sg/auth/lock_channel.h"
#include "sg/auth/lockout_policy.h"
#include "sg/auth/password_hasher.h"
#include "sg/auth/recovery_key.h"
#include "sg/auth/session_events.h"

namespace sg::auth {

enum class AuthOutcome { kSuccess, kInvalidCredential, kLockedOut, kCorruptStore };

std::string_view ToString(AuthOutcome outcome) noexcept;

enum class TransitionCause {
  kLoginSuccess,
  kLoginFailure,
  kLockout,
  kIdleTimeout,
  kOsEvent,
  kManualLogout,
  kRecoveryReset
};

std::string_view ToString(TransitionCause cause) noexcept;

struct SessionTransition {
  SessionState previous{SessionState::kLocked};
  SessionState current{SessionState::kLocked};
  TransitionCause cause{TransitionCause::kManualLogout};
  std::optional<SessionEventKind> os_event;
  TimePoint at{};
  // False for idempotent requests and rejected attempts.
  bool changed{false};
};

struct AuthResult {
  AuthOutcome outcome{AuthOutcome::kInvalidCredential};
  LockoutDecision lockout;
  // Time until the lockout expires; zero when not locked out.
  std::chrono::seconds retry_after{0};

  [[nodiscard]] bool ok() const noexcept { return outcome == AuthOutcome::kSuccess; }
};

struct RecoveryRedemption {
  AuthResult result;
  std::optional<CredentialResetTicket> ticket;
};

struct ChangePasswordResult {
  AuthResult result;
  // Present only when the password was changed.
  std::optional<IssuedRecoveryKey> recovery_key;
};

struct SessionStatus {
  SessionState state{SessionState::kLocked};
  bool protection_enabled{false};
  bool corrupt_store{false};
  uint32_t failed_attempts{0};
  std::chrono::seconds remaining_lockout{0};
  bool auto_lock_enabled{false};
  uint32_t auto_lock_timeout_seconds{kDefaultAutoLockTimeoutSeconds};
  bool os_lock_integration_enabled{true};
  std::optional<TimePoint> last_success_at;
};

struct SessionOptions {
  LockoutConfig lockout{};
  std::chrono::milliseconds idle_check_interval{std::chrono::seconds(60)};
  WallClock wall_clock;
  IdleMonitor::TimeSource idle_clock;
};

// Single authority over the UNLOCKED/LOCKED state.
//
// Every transition runs under one mutex. Lock requests from the idle monitor,
// the OS session bridge and RequestLock() travel over a channel drained by a
// dispatcher thread; a request posted while a login is in flight is applied
// right after that login resolves. Operations that change state first apply
// any request already queued.
//
// Observers run on the transitioning thread, in transition order, with the
// transition mutex held. They may post lock requests but must not call
// transition methods.
class SessionStateMachine {
 public:
  using TransitionObserver = std::function<void(const SessionTransition&)>;
  using ObserverId = uint64_t;

  // Opens |store|; the initial state is LOCKED when a password is set or the
  // store is corrupt. Both references must outlive the state machine.
  SessionStateMachine(CredentialStore& store, const PasswordHasher& hasher,
                      SessionOptions options = {});
  ~SessionStateMachine();

  SessionStateMachine(const SessionStateMachine&) = delete;
  SessionStateMachine& operator=(const SessionStateMachine&) = delete;

  [[nodiscard]] SessionState State() const noexcept { return state_.load(std::memory_order_acquire); }
  [[nodiscard]] SessionStatus Status() const;

  AuthResult Login(std::string_view secret);
  SessionTransition Logout();

  // Queues an asynchronous lock request and returns its sequence number.
  uint64_t RequestLock(LockSource source = LockSource::kManual,
                       std::optional<SessionEventKind> os_event = std::nullopt);

  void NotifyActivity() noexcept;
  // Runs one idle check; returns true when it emitted a lock request.
  bool CheckIdle();
  void StartIdleChecks();
  void StopIdleChecks();

  void AttachSessionEventSource(SessionEventSource& source);
  void DetachSessionEventSource();
  // For hosts that receive session notifications themselves.
  void OnSessionEvent(SessionEventKind kind);

  // Requires that no password is set and the session is UNLOCKED.
  IssuedRecoveryKey SetupPassword(std::string_view new_password);
  // Requires UNLOCKED. Always rotates the recovery key on success.
  ChangePasswordResult ChangePassword(std::string_view current, std::string_view new_password);
  // Requires UNLOCKED. Clears both credentials.
  AuthResult DisableProtection(std::string_view current);

  RecoveryRedemption BeginRecovery(std::string_view recovery_key);
  // Consumes |ticket| on success and leaves the session UNLOCKED. A policy
  // violation throws and leaves the ticket usable.
  IssuedRecoveryKey CompleteRecovery(CredentialResetTicket& ticket, std::string_view new_password);

  void ConfigureAutoLock(bool enabled, uint32_t timeout_seconds);
  void ConfigureOsLockIntegration(bool enabled);

  ObserverId Subscribe(TransitionObserver observer);
  void Unsubscribe(ObserverId id);

  // Waits until the request with |sequence| has been applied.
  bool WaitUntilProcessed(uint64_t sequence, std::chrono::milliseconds timeout);

 private:
  // All *Locked members expect transition_mutex_ to be held.
  void DrainPendingLocked();
  void ApplyLockLocked(TransitionCause cause, std::optional<SessionEventKind> os_event);
  void UnlockLocked(TransitionCause cause);
  void EmitLocked(const SessionTransition& transition);
  void RequireUnlockedLocked() const;
  void RequireHealthyStoreLocked() const;
  // Lockout gate, verification and failure accounting shared by every path
  // that checks a credential. On success |settings| holds the snapshot with
  // the counter reset but not yet committed.
  AuthResult VerifyLocked(std::string_view secret, bool recovery_key, AuthSettings& settings);
  void DispatchLoop();

  CredentialStore& store_;
  const PasswordHasher& hasher_;
  RecoveryFlow recovery_;
  WallClock clock_;
  LockoutPolicy lockout_;
  std::chrono::milliseconds idle_check_interval_;

  LockRequestChannel channel_;
  IdleMonitor idle_;
  SessionBridge bridge_;
  PeriodicTask idle_task_;

  std::mutex transition_mutex_;
  std::atomic<SessionState> state_{SessionState::kLocked};
  uint64_t ticket_counter_{0};
  std::optional<uint64_t> active_ticket_;

  std::mutex observers_mutex_;
  std::vector<std::pair<ObserverId, TransitionObserver>> observers_;
  ObserverId next_observer_id_{1};

  std::mutex processed_mutex_;
  std::condition_variable processed_cv_;
  uint64_t last_processed_{0};

  std::thread dispatcher_;
};

}  // namespace sg::auth
