#include "sg/auth/session_state_machine.h"

#include <string>

#include "sg/auth/password_policy.h"
#include "sg/error.h"
#include "sg/errors.h"
#include "sg/orchestrator/event_bus.h"

namespace sg::auth {
namespace {

constexpr std::chrono::milliseconds kDispatcherPoll{250};

TransitionCause CauseForSource(LockSource source) {
  switch (source) {
  case LockSource::kIdleTimeout:
    return TransitionCause::kIdleTimeout;
  case LockSource::kOsEvent:
    return TransitionCause::kOsEvent;
  case LockSource::kManual:
    return TransitionCause::kManualLogout;
  }
  return TransitionCause::kManualLogout;
}

void PublishTransition(const SessionTransition& transition) {
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kSecurity;
  event.severity = transition.cause == TransitionCause::kLockout
                       ? orchestrator::EventSeverity::kWarning
                       : orchestrator::EventSeverity::kInfo;
  event.event_id = "session_transition";
  event.message = "Session " + std::string(ToString(transition.current));
  event.fields.emplace_back("previous", std::string(ToString(transition.previous)));
  event.fields.emplace_back("current", std::string(ToString(transition.current)));
  event.fields.emplace_back("cause", std::string(ToString(transition.cause)));
  if (transition.os_event) {
    event.fields.emplace_back("os_event", std::string(ToString(*transition.os_event)));
  }
  event.fields.emplace_back("changed", transition.changed ? "true" : "false",
                            orchestrator::FieldPrivacy::kPublic, true);
  orchestrator::EventBus::Instance().Publish(event);
}

void PublishSecurityNotice(std::string_view id, std::string_view message) {
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kSecurity;
  event.severity = orchestrator::EventSeverity::kInfo;
  event.event_id = std::string(id);
  event.message = std::string(message);
  orchestrator::EventBus::Instance().Publish(event);
}

}  // namespace

std::string_view ToString(AuthOutcome outcome) noexcept {
  switch (outcome) {
  case AuthOutcome::kSuccess:
    return "success";
  case AuthOutcome::kInvalidCredential:
    return "invalid_credential";
  case AuthOutcome::kLockedOut:
    return "locked_out";
  case AuthOutcome::kCorruptStore:
    return "corrupt_store";
  }
  return "unknown";
}

std::string_view ToString(TransitionCause cause) noexcept {
  switch (cause) {
  case TransitionCause::kLoginSuccess:
    return "login_success";
  case TransitionCause::kLoginFailure:
    return "login_failure";
  case TransitionCause::kLockout:
    return "lockout";
  case TransitionCause::kIdleTimeout:
    return "idle_timeout";
  case TransitionCause::kOsEvent:
    return "os_event";
  case TransitionCause::kManualLogout:
    return "manual_logout";
  case TransitionCause::kRecoveryReset:
    return "recovery_reset";
  }
  return "unknown";
}

SessionStateMachine::SessionStateMachine(CredentialStore& store, const PasswordHasher& hasher,
                                         SessionOptions options)
    : store_(store),
      hasher_(hasher),
      recovery_(hasher),
      clock_(options.wall_clock ? options.wall_clock : SystemWallClock()),
      lockout_(store, options.lockout, clock_),
      idle_check_interval_(options.idle_check_interval),
      channel_(clock_),
      idle_(options.idle_clock),
      bridge_(channel_) {
  store_.Open();
  const AuthSettings settings = store_.Snapshot();
  const bool locked = store_.corrupt() || settings.ProtectionEnabled();

  idle_.Configure(settings.auto_lock_enabled, std::chrono::seconds(settings.auto_lock_timeout_seconds));
  idle_.on_expire = [this]() { channel_.Post(LockSource::kIdleTimeout); };
  bridge_.SetEnabled(settings.os_lock_integration_enabled);
  if (!locked) {
    idle_.Arm();
  }
  state_.store(locked ? SessionState::kLocked : SessionState::kUnlocked, std::memory_order_release);

  orchestrator::Event started;
  started.category = orchestrator::EventCategory::kLifecycle;
  started.severity = store_.corrupt() ? orchestrator::EventSeverity::kCritical
                                      : orchestrator::EventSeverity::kInfo;
  started.event_id = "session_started";
  started.message = store_.corrupt() ? std::string(errors::msg::kCorruptStore) : "Session gate ready";
  started.fields.emplace_back("state", std::string(ToString(State())));
  started.fields.emplace_back("protection_enabled", settings.ProtectionEnabled() ? "true" : "false",
                              orchestrator::FieldPrivacy::kPublic, true);
  orchestrator::EventBus::Instance().Publish(started);

  dispatcher_ = std::thread([this]() { DispatchLoop(); });
}

SessionStateMachine::~SessionStateMachine() {
  idle_task_.Stop();
  bridge_.Detach();
  channel_.Close();
  if (dispatcher_.joinable()) {
    dispatcher_.join();
  }
}

void SessionStateMachine::DispatchLoop() {
  for (;;) {
    const bool pending = channel_.WaitForPending(kDispatcherPoll);
    if (pending) {
      std::lock_guard<std::mutex> guard(transition_mutex_);
      DrainPendingLocked();
    } else if (channel_.closed()) {
      return;
    }
  }
}

void SessionStateMachine::DrainPendingLocked() {
  while (auto request = channel_.TryPop()) {
    ApplyLockLocked(CauseForSource(request->source), request->os_event);
    {
      std::lock_guard<std::mutex> guard(processed_mutex_);
      last_processed_ = request->sequence;
    }
    processed_cv_.notify_all();
  }
}

void SessionStateMachine::EmitLocked(const SessionTransition& transition) {
  PublishTransition(transition);
  std::vector<std::pair<ObserverId, TransitionObserver>> observers;
  {
    std::lock_guard<std::mutex> guard(observers_mutex_);
    observers = observers_;
  }
  for (const auto& [id, observer] : observers) {
    try {
      observer(transition);
    } catch (const std::exception& ex) {
      orchestrator::Event event;
      event.category = orchestrator::EventCategory::kDiagnostics;
      event.severity = orchestrator::EventSeverity::kError;
      event.event_id = "transition_observer_failed";
      event.message = ex.what();
      event.fields.emplace_back("observer", std::to_string(id), orchestrator::FieldPrivacy::kPublic,
                                true);
      orchestrator::EventBus::Instance().Publish(event);
    }
  }
}

void SessionStateMachine::ApplyLockLocked(TransitionCause cause,
                                          std::optional<SessionEventKind> os_event) {
  SessionTransition transition;
  transition.previous = state_.exchange(SessionState::kLocked, std::memory_order_acq_rel);
  transition.current = SessionState::kLocked;
  transition.cause = cause;
  transition.os_event = os_event;
  transition.at = clock_();
  transition.changed = transition.previous != SessionState::kLocked;
  idle_.Disarm();
  EmitLocked(transition);
}

void SessionStateMachine::UnlockLocked(TransitionCause cause) {
  SessionTransition transition;
  transition.previous = state_.load(std::memory_order_acquire);
  transition.current = SessionState::kUnlocked;
  transition.cause = cause;
  transition.at = clock_();
  transition.changed = transition.previous != SessionState::kUnlocked;
  idle_.Arm();
  state_.store(SessionState::kUnlocked, std::memory_order_release);
  EmitLocked(transition);
}

void SessionStateMachine::RequireUnlockedLocked() const {
  if (State() != SessionState::kUnlocked) {
    throw Error(ErrorDomain::State, errors::auth::kSessionLocked,
                std::string(errors::msg::kSessionLocked));
  }
}

void SessionStateMachine::RequireHealthyStoreLocked() const {
  if (store_.corrupt()) {
    throw Error(ErrorDomain::State, errors::auth::kCorruptStore,
                std::string(errors::msg::kCorruptStore));
  }
}

AuthResult SessionStateMachine::VerifyLocked(std::string_view secret, bool recovery_key,
                                             AuthSettings& settings) {
  AuthResult result;
  const TimePoint now = clock_();
  const LockoutDecision current = lockout_.Current(now);
  if (current.locked_out) {
    result.outcome = AuthOutcome::kLockedOut;
    result.lockout = current;
    result.retry_after = std::chrono::ceil<std::chrono::seconds>(*current.lockout_until - now);
    return result;
  }

  settings = store_.Snapshot();
  const std::string& digest = recovery_key ? *settings.recovery_key_hash : *settings.password_hash;
  const bool verified =
      recovery_key ? recovery_.Redeem(secret, digest) : hasher_.Verify(secret, digest);
  if (!verified) {
    result.outcome = AuthOutcome::kInvalidCredential;
    result.lockout = lockout_.ApplyFailure(settings, now);
    store_.Commit(settings);
    if (result.lockout.locked_out) {
      result.retry_after =
          std::chrono::ceil<std::chrono::seconds>(*result.lockout.lockout_until - now);
    }
    return result;
  }

  lockout_.ApplySuccess(settings, now);
  result.outcome = AuthOutcome::kSuccess;
  result.lockout = lockout_.Describe(settings, now);
  return result;
}

AuthResult SessionStateMachine::Login(std::string_view secret) {
  std::lock_guard<std::mutex> guard(transition_mutex_);
  DrainPendingLocked();

  AuthResult result;
  if (store_.corrupt()) {
    result.outcome = AuthOutcome::kCorruptStore;
    PublishSecurityNotice("login_refused", errors::msg::kCorruptStore);
    return result;
  }
  if (State() == SessionState::kUnlocked) {
    result.outcome = AuthOutcome::kSuccess;
    return result;
  }

  AuthSettings settings = store_.Snapshot();
  if (!settings.ProtectionEnabled()) {
    result.outcome = AuthOutcome::kSuccess;
    UnlockLocked(TransitionCause::kLoginSuccess);
    return result;
  }

  result = VerifyLocked(secret, false, settings);
  if (!result.ok()) {
    SessionTransition transition;
    transition.cause = result.outcome == AuthOutcome::kLockedOut || result.lockout.locked_out
                           ? TransitionCause::kLockout
                           : TransitionCause::kLoginFailure;
    transition.at = clock_();
    EmitLocked(transition);
    return result;
  }

  if (hasher_.NeedsRehash(*settings.password_hash)) {
    settings.password_hash = hasher_.Hash(secret);
  }
  store_.Commit(settings);
  UnlockLocked(TransitionCause::kLoginSuccess);
  return result;
}

SessionTransition SessionStateMachine::Logout() {
  std::lock_guard<std::mutex> guard(transition_mutex_);
  DrainPendingLocked();
  SessionTransition transition;
  transition.previous = State();
  ApplyLockLocked(TransitionCause::kManualLogout, std::nullopt);
  transition.cause = TransitionCause::kManualLogout;
  transition.at = clock_();
  transition.changed = transition.previous != SessionState::kLocked;
  return transition;
}

uint64_t SessionStateMachine::RequestLock(LockSource source,
                                          std::optional<SessionEventKind> os_event) {
  return channel_.Post(source, os_event);
}

void SessionStateMachine::NotifyActivity() noexcept {
  idle_.NotifyActivity();
}

bool SessionStateMachine::CheckIdle() {
  return idle_.Check();
}

void SessionStateMachine::StartIdleChecks() {
  idle_task_.Start(idle_check_interval_, [this]() { CheckIdle(); });
}

void SessionStateMachine::StopIdleChecks() {
  idle_task_.Stop();
}

void SessionStateMachine::AttachSessionEventSource(SessionEventSource& source) {
  bridge_.Attach(source);
}

void SessionStateMachine::DetachSessionEventSource() {
  bridge_.Detach();
}

void SessionStateMachine::OnSessionEvent(SessionEventKind kind) {
  bridge_.OnEvent(kind);
}

IssuedRecoveryKey SessionStateMachine::SetupPassword(std::string_view new_password) {
  std::lock_guard<std::mutex> guard(transition_mutex_);
  DrainPendingLocked();
  RequireHealthyStoreLocked();
  AuthSettings settings = store_.Snapshot();
  if (settings.ProtectionEnabled()) {
    throw Error(ErrorDomain::State, errors::auth::kCredentialAlreadySet,
                std::string(errors::msg::kCredentialAlreadySet));
  }
  RequireUnlockedLocked();
  EnforcePasswordPolicy(new_password);

  IssuedRecoveryKey key = recovery_.Issue();
  settings.password_hash = hasher_.Hash(new_password);
  settings.recovery_key_hash = key.Hash();
  settings.failed_attempts = 0;
  settings.lockout_until.reset();
  store_.Commit(settings);
  active_ticket_.reset();
  PublishSecurityNotice("credential_configured", "Password protection enabled");
  return key;
}

ChangePasswordResult SessionStateMachine::ChangePassword(std::string_view current,
                                                         std::string_view new_password) {
  std::lock_guard<std::mutex> guard(transition_mutex_);
  DrainPendingLocked();
  RequireHealthyStoreLocked();
  RequireUnlockedLocked();
  AuthSettings settings = store_.Snapshot();
  if (!settings.ProtectionEnabled()) {
    throw Error(ErrorDomain::State, errors::auth::kNoCredentialSet,
                std::string(errors::msg::kNoCredentialSet));
  }
  EnforcePasswordPolicy(new_password);

  ChangePasswordResult change;
  change.result = VerifyLocked(current, false, settings);
  if (!change.result.ok()) {
    PublishSecurityNotice("credential_change_rejected", ToString(change.result.outcome));
    return change;
  }
  IssuedRecoveryKey key = recovery_.Issue();
  settings.password_hash = hasher_.Hash(new_password);
  settings.recovery_key_hash = key.Hash();
  store_.Commit(settings);
  active_ticket_.reset();
  change.recovery_key.emplace(std::move(key));
  PublishSecurityNotice("credential_rotated", "Password changed and recovery key rotated");
  return change;
}

AuthResult SessionStateMachine::DisableProtection(std::string_view current) {
  std::lock_guard<std::mutex> guard(transition_mutex_);
  DrainPendingLocked();
  RequireHealthyStoreLocked();
  RequireUnlockedLocked();
  AuthSettings settings = store_.Snapshot();
  if (!settings.ProtectionEnabled()) {
    throw Error(ErrorDomain::State, errors::auth::kNoCredentialSet,
                std::string(errors::msg::kNoCredentialSet));
  }

  AuthResult result = VerifyLocked(current, false, settings);
  if (!result.ok()) {
    PublishSecurityNotice("credential_removal_rejected", ToString(result.outcome));
    return result;
  }
  settings.password_hash.reset();
  settings.recovery_key_hash.reset();
  store_.Commit(settings);
  active_ticket_.reset();
  PublishSecurityNotice("credential_removed", "Password protection disabled");
  return result;
}

RecoveryRedemption SessionStateMachine::BeginRecovery(std::string_view recovery_key) {
  std::lock_guard<std::mutex> guard(transition_mutex_);
  DrainPendingLocked();

  RecoveryRedemption redemption;
  if (store_.corrupt()) {
    redemption.result.outcome = AuthOutcome::kCorruptStore;
    PublishSecurityNotice("recovery_refused", errors::msg::kCorruptStore);
    return redemption;
  }
  AuthSettings settings = store_.Snapshot();
  if (!settings.ProtectionEnabled()) {
    throw Error(ErrorDomain::State, errors::auth::kNoCredentialSet,
                std::string(errors::msg::kNoCredentialSet));
  }

  redemption.result = VerifyLocked(recovery_key, true, settings);
  if (!redemption.result.ok()) {
    SessionTransition transition;
    transition.previous = State();
    transition.current = transition.previous;
    transition.cause = redemption.result.outcome == AuthOutcome::kLockedOut ||
                               redemption.result.lockout.locked_out
                           ? TransitionCause::kLockout
                           : TransitionCause::kLoginFailure;
    transition.at = clock_();
    EmitLocked(transition);
    return redemption;
  }
  // Counters reset when the new password is stored, not at redemption.
  active_ticket_ = ++ticket_counter_;
  redemption.ticket = CredentialResetTicket(*active_ticket_);
  PublishSecurityNotice("recovery_key_redeemed", "Credential reset authorized");
  return redemption;
}

IssuedRecoveryKey SessionStateMachine::CompleteRecovery(CredentialResetTicket& ticket,
                                                        std::string_view new_password) {
  std::lock_guard<std::mutex> guard(transition_mutex_);
  DrainPendingLocked();
  if (ticket.empty() || !active_ticket_ || *active_ticket_ != ticket.serial_) {
    throw Error(ErrorDomain::Security, errors::auth::kResetTicketInvalid,
                std::string(errors::msg::kResetTicketInvalid));
  }
  RequireHealthyStoreLocked();
  EnforcePasswordPolicy(new_password);

  AuthSettings settings = store_.Snapshot();
  IssuedRecoveryKey key = recovery_.Issue();
  settings.password_hash = hasher_.Hash(new_password);
  settings.recovery_key_hash = key.Hash();
  lockout_.ApplySuccess(settings, clock_());
  store_.Commit(settings);
  active_ticket_.reset();
  ticket.serial_ = 0;
  UnlockLocked(TransitionCause::kRecoveryReset);
  return key;
}

void SessionStateMachine::ConfigureAutoLock(bool enabled, uint32_t timeout_seconds) {
  if (timeout_seconds == 0) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                "Auto-lock timeout must be positive");
  }
  std::lock_guard<std::mutex> guard(transition_mutex_);
  DrainPendingLocked();
  RequireHealthyStoreLocked();
  RequireUnlockedLocked();
  AuthSettings settings = store_.Snapshot();
  settings.auto_lock_enabled = enabled;
  settings.auto_lock_timeout_seconds = timeout_seconds;
  store_.Commit(settings);
  idle_.Configure(enabled, std::chrono::seconds(timeout_seconds));
  if (enabled) {
    idle_.Arm();
  }
}

void SessionStateMachine::ConfigureOsLockIntegration(bool enabled) {
  std::lock_guard<std::mutex> guard(transition_mutex_);
  DrainPendingLocked();
  RequireHealthyStoreLocked();
  RequireUnlockedLocked();
  AuthSettings settings = store_.Snapshot();
  settings.os_lock_integration_enabled = enabled;
  store_.Commit(settings);
  bridge_.SetEnabled(enabled);
}

SessionStatus SessionStateMachine::Status() const {
  const AuthSettings settings = store_.Snapshot();
  const TimePoint now = clock_();
  const LockoutDecision decision = lockout_.Describe(settings, now);

  SessionStatus status;
  status.state = State();
  status.protection_enabled = settings.ProtectionEnabled();
  status.corrupt_store = store_.corrupt();
  status.failed_attempts = settings.failed_attempts;
  if (decision.locked_out) {
    status.remaining_lockout =
        std::chrono::ceil<std::chrono::seconds>(*decision.lockout_until - now);
  }
  status.auto_lock_enabled = settings.auto_lock_enabled;
  status.auto_lock_timeout_seconds = settings.auto_lock_timeout_seconds;
  status.os_lock_integration_enabled = settings.os_lock_integration_enabled;
  status.last_success_at = settings.last_success_at;
  return status;
}

SessionStateMachine::ObserverId SessionStateMachine::Subscribe(TransitionObserver observer) {
  std::lock_guard<std::mutex> guard(observers_mutex_);
  const ObserverId id = next_observer_id_++;
  observers_.emplace_back(id, std::move(observer));
  return id;
}

void SessionStateMachine::Unsubscribe(ObserverId id) {
  std::lock_guard<std::mutex> guard(observers_mutex_);
  std::erase_if(observers_, [id](const auto& entry) { return entry.first == id; });
}

bool SessionStateMachine::WaitUntilProcessed(uint64_t sequence, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(processed_mutex_);
  return processed_cv_.wait_for(lock, timeout, [&] { return last_processed_ >= sequence; });
}

}  // namespace sg::auth
