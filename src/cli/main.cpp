#include <array>
#include <atomic>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <ctime>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <signal.h>
#include <termios.h>
#include <unistd.h>

#include "sg/auth/auth_config.h"
#include "sg/auth/credential_store.h"
#include "sg/auth/password_policy.h"
#include "sg/auth/session_events.h"
#include "sg/auth/session_state_machine.h"
#include "sg/common.h"
#include "sg/crypto/ct.h"
#include "sg/crypto/hmac_sha256.h"
#include "sg/error.h"
#include "sg/errors.h"
#include "sg/orchestrator/event_bus.h"
#include "sg/security/zeroizer.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 64;
  constexpr int kExitIO = 74;
  constexpr int kExitAuth = 77;

  constexpr std::string_view kGenericAuthFailureMessage = "Authentication failed.";

  void PrintUsage() {
    std::cerr << "SessionGate\n";
    std::cerr << "Usage:\n";
    std::cerr << "  sgctl [flags] status\n";
    std::cerr << "  sgctl [flags] setup\n";
    std::cerr << "  sgctl [flags] login\n";
    std::cerr << "  sgctl [flags] recover\n";
    std::cerr << "  sgctl [flags] change-password\n";
    std::cerr << "  sgctl [flags] disable\n";
    std::cerr << "  sgctl [flags] auto-lock <on|off> [--timeout=SECONDS]\n";
    std::cerr << "  sgctl [flags] os-lock <on|off>\n";
    std::cerr << "  sgctl [flags] run\n";
    std::cerr << "\nGlobal flags:\n";
    std::cerr << "  --state-dir=PATH     Directory holding auth.sgs and audit.log\n";
    std::cerr << "  --hash-cost=N        Work factor for new digests (4-20, default 12)\n";
    std::cerr << "  --no-audit-log       Do not append to the audit log\n";
    std::cerr << "\nrun reads commands from stdin: activity, lock, unlock, status, quit.\n";
    std::cerr << "SIGUSR1 = screen locked, SIGUSR2 = sleep, SIGHUP = remote session disconnected.\n";
    std::cerr << "\nLosing both the password and the recovery key is permanent: no command\n";
    std::cerr << "can restore access.\n";
  }

  std::atomic<char*> g_signal_buffer{nullptr};
  std::atomic<size_t> g_signal_length{0};

  void PasswordSignalHandler(int sig) {
    auto* buffer = g_signal_buffer.load(std::memory_order_acquire);
    const size_t len = g_signal_length.load(std::memory_order_acquire);
    if (buffer && len > 0) {
      volatile char* wipe = buffer;
      for (size_t i = 0; i < len; ++i) {
        wipe[i] = 0;
      }
    }
    _exit(128 + sig);
  }

  // Wipes the in-progress password buffer if the prompt is interrupted.
  class PasswordSignalGuard {
   public:
    PasswordSignalGuard(char* buffer, size_t length) {
      g_signal_buffer.store(buffer, std::memory_order_release);
      g_signal_length.store(length, std::memory_order_release);
      struct sigaction sa {};
      sa.sa_handler = PasswordSignalHandler;
      sigemptyset(&sa.sa_mask);
      sa.sa_flags = 0;
      sigaction(SIGINT, &sa, &old_int_);
      sigaction(SIGTERM, &sa, &old_term_);
    }
    ~PasswordSignalGuard() {
      sigaction(SIGINT, &old_int_, nullptr);
      sigaction(SIGTERM, &old_term_, nullptr);
      g_signal_buffer.store(nullptr, std::memory_order_release);
      g_signal_length.store(0, std::memory_order_release);
    }

   private:
    struct sigaction old_int_ {};
    struct sigaction old_term_ {};
  };

  class TermiosGuard {
   public:
    TermiosGuard(int fd, const termios& state) : fd_(fd), state_(state), restored_(false) {}
    ~TermiosGuard() { Restore(); }
    void Restore() {
      if (!restored_) {
        tcsetattr(fd_, TCSAFLUSH, &state_);
        restored_ = true;
      }
    }

   private:
    int fd_;
    termios state_;
    bool restored_;
  };

  std::string ReadSecret(const std::string& prompt) {
    if (!isatty(STDIN_FILENO)) {
      throw sg::Error{sg::ErrorDomain::IO, sg::errors::io::kPasswordPromptNeedsTty,
                      "Password prompt requires a TTY"};
    }
    termios original{};
    if (tcgetattr(STDIN_FILENO, &original) != 0) {
      const int err = errno;
      throw sg::Error{sg::ErrorDomain::IO, sg::errors::io::kConsoleModeQueryFailed,
                      "Failed to query terminal attributes.", err};
    }
    TermiosGuard guard(STDIN_FILENO, original);
    termios silent = original;
    silent.c_lflag &= ~ECHO;
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) != 0) {
      const int err = errno;
      throw sg::Error{sg::ErrorDomain::IO, sg::errors::io::kConsoleEchoDisableFailed,
                      "Failed to disable terminal echo.", err};
    }

    std::cout << prompt << std::flush;

    std::array<char, sg::auth::kMaxPasswordLen + 1> buffer{};
    sg::security::Zeroizer::ScopeWiper<char> buf_guard(buffer.data(), buffer.size());
    PasswordSignalGuard signal_guard(buffer.data(), buffer.size());

    size_t pos = 0;
    bool overflow = false;
    while (true) {
      char ch = 0;
      ssize_t n = ::read(STDIN_FILENO, &ch, 1);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        const int err = errno;
        throw sg::Error{sg::ErrorDomain::IO, sg::errors::io::kPasswordReadFailed,
                        "Failed to read password input.", err};
      }
      if (n == 0) {
        break;
      }
      if (ch == '\r') {
        continue;
      }
      if (ch == '\n') {
        break;
      }
      if (ch == '\b' || ch == 0x7F) {
        if (pos > 0) {
          --pos;
          buffer[pos] = 0;
        }
        continue;
      }
      if (pos >= sg::auth::kMaxPasswordLen) {
        overflow = true;
        continue;
      }
      buffer[pos++] = ch;
    }

    guard.Restore();
    std::cout << std::endl;

    if (overflow) {
      throw sg::Error{sg::ErrorDomain::Validation, sg::errors::validation::kPasswordPolicy,
                      std::string(sg::errors::msg::kPasswordTooLong)};
    }
    return std::string(buffer.data(), pos);
  }

  // Owns a secret read from the terminal and wipes it on scope exit.
  struct Secret {
    std::string value;
    explicit Secret(std::string v) : value(std::move(v)) {}
    ~Secret() { sg::security::Zeroizer::WipeString(value); }
    Secret(const Secret&) = delete;
    Secret& operator=(const Secret&) = delete;
  };

  Secret ReadNewPassword() {
    Secret first(ReadSecret("New password: "));
    sg::auth::EnforcePasswordPolicy(first.value);
    const auto strength = sg::auth::EvaluatePasswordStrength(first.value);
    std::cout << "Strength: " << strength.label << " (" << strength.score << "/4)" << std::endl;
    Secret second(ReadSecret("Confirm password: "));
    if (!sg::crypto::ct::CompareEqual(sg::AsBytes(first.value), sg::AsBytes(second.value))) {
      throw sg::Error{sg::ErrorDomain::Validation, sg::errors::validation::kPasswordMismatch,
                      std::string(sg::errors::msg::kPasswordsDoNotMatch)};
    }
    return Secret(std::move(first.value));
  }

  std::string_view DomainPrefix(sg::ErrorDomain domain) {
    switch (domain) {
    case sg::ErrorDomain::IO:
      return "I/O error";
    case sg::ErrorDomain::Security:
      return "Security error";
    case sg::ErrorDomain::Crypto:
      return "Cryptography error";
    case sg::ErrorDomain::Validation:
      return "Validation error";
    case sg::ErrorDomain::Config:
      return "Configuration error";
    case sg::ErrorDomain::State:
      return "State error";
    case sg::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  std::string DescribeErrorDetailed(const sg::Error& err) {
    if (!sg::IsFrameworkErrorCode(err.domain, err.code)) {
      return std::string(err.what());
    }
    switch (err.code) {
    case sg::errors::io::kPasswordPromptNeedsTty:
      return "Password prompt requires an interactive terminal. Details: " + std::string(err.what());
    case sg::errors::io::kSettingsWriteFailed:
    case sg::errors::io::kSettingsReadFailed:
      return "Authentication settings are busy or inaccessible. Details: " + std::string(err.what());
    case sg::errors::auth::kCorruptStore:
      return std::string(err.what()) +
             ". Restore auth.sgs from a backup; protection stays on until then.";
    case sg::errors::auth::kSessionLocked:
      return "Unlock the session first. Details: " + std::string(err.what());
    default:
      return std::string(err.what());
    }
  }

  std::string MakeReferenceTag(std::string_view detail) {
    if (detail.empty()) {
      return {};
    }
    auto digest = sg::crypto::SHA256_Hash(sg::AsBytes(detail));
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    constexpr size_t kPrefixBytes = 6;
    for (size_t i = 0; i < kPrefixBytes && i < digest.size(); ++i) {
      oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
  }

  std::string DescribeError(const sg::Error& err) {
#ifdef NDEBUG
    if (err.domain == sg::ErrorDomain::Security || err.domain == sg::ErrorDomain::Crypto ||
        err.domain == sg::ErrorDomain::Internal) {
      return "Operation failed. [ref:#" + MakeReferenceTag(err.what()) + "]";
    }
#endif
    return DescribeErrorDetailed(err);
  }

  void ReportError(const sg::Error& err) {
    const std::string detail = DescribeError(err);
    std::cerr << DomainPrefix(err.domain) << ": " << detail << '\n';

    sg::orchestrator::Event event;
    event.category = sg::orchestrator::EventCategory::kDiagnostics;
    event.severity = sg::orchestrator::EventSeverity::kError;
    event.event_id = "cli_error";
    event.message = detail;
    event.fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
    event.fields.emplace_back("code", std::to_string(err.code),
                              sg::orchestrator::FieldPrivacy::kPublic, true);
    if (err.native_code.has_value()) {
      event.fields.emplace_back("native_code", std::to_string(*err.native_code),
                                sg::orchestrator::FieldPrivacy::kHash, true);
    }
    try {
      sg::orchestrator::EventBus::Instance().Publish(event);
    } catch (const std::exception& publish_error) {
      std::clog << "{\"event\":\"eventbus_error\",\"message\":\"error report publish failed\",\"detail\":\""
                << publish_error.what() << "\"}" << std::endl;
    }
  }

  int ExitCodeFor(const sg::Error& err) {
    switch (err.domain) {
    case sg::ErrorDomain::IO:
      return kExitIO;
    case sg::ErrorDomain::Security:
    case sg::ErrorDomain::Crypto:
      return kExitAuth;
    case sg::ErrorDomain::Validation:
    case sg::ErrorDomain::Config:
      return kExitUsage;
    case sg::ErrorDomain::State:
    case sg::ErrorDomain::Internal:
    default:
      return kExitIO;
    }
  }

  std::string FormatDuration(std::chrono::seconds remaining) {
    const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(remaining);
    const auto seconds = remaining - minutes;
    std::ostringstream oss;
    if (minutes.count() > 0) {
      oss << minutes.count() << "m ";
    }
    oss << seconds.count() << "s";
    return oss.str();
  }

  std::string FormatTime(sg::auth::TimePoint tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
  }

  // Prints the outcome and returns the matching exit code.
  int ReportAuthResult(const sg::auth::AuthResult& result) {
    switch (result.outcome) {
    case sg::auth::AuthOutcome::kSuccess:
      std::cout << "Unlocked." << std::endl;
      return kExitOk;
    case sg::auth::AuthOutcome::kInvalidCredential:
      std::cerr << kGenericAuthFailureMessage;
      if (result.lockout.locked_out) {
        std::cerr << " Too many failed attempts; try again in " << FormatDuration(result.retry_after)
                  << ".";
      } else {
        std::cerr << " " << result.lockout.attempts_remaining
                  << " attempt(s) remaining before lockout.";
      }
      std::cerr << std::endl;
      return kExitAuth;
    case sg::auth::AuthOutcome::kLockedOut:
      std::cerr << sg::errors::msg::kLockedOut << ". Try again in "
                << FormatDuration(result.retry_after) << "." << std::endl;
      return kExitAuth;
    case sg::auth::AuthOutcome::kCorruptStore:
      std::cerr << sg::errors::msg::kCorruptStore
                << ". Restore auth.sgs from a backup; access stays locked." << std::endl;
      return kExitIO;
    }
    return kExitAuth;
  }

  void PrintStatus(const sg::auth::SessionStatus& status) {
    std::cout << "state: " << sg::auth::ToString(status.state) << '\n';
    std::cout << "protection: " << (status.protection_enabled ? "enabled" : "disabled") << '\n';
    if (status.corrupt_store) {
      std::cout << "store: CORRUPT\n";
    }
    std::cout << "failed_attempts: " << status.failed_attempts << '\n';
    if (status.remaining_lockout.count() > 0) {
      std::cout << "locked_out_for: " << FormatDuration(status.remaining_lockout) << '\n';
    }
    std::cout << "auto_lock: " << (status.auto_lock_enabled ? "on" : "off") << " ("
              << status.auto_lock_timeout_seconds << "s)\n";
    std::cout << "os_lock_integration: " << (status.os_lock_integration_enabled ? "on" : "off")
              << '\n';
    if (status.last_success_at) {
      std::cout << "last_success_at: " << FormatTime(*status.last_success_at) << '\n';
    }
    std::cout << std::flush;
  }

  void PrintRecoveryKey(const sg::auth::IssuedRecoveryKey& key) {
    std::cout << "\nRecovery key (shown once, store it offline):\n\n    " << key.Plaintext()
              << "\n\nAny previous recovery key no longer works." << std::endl;
  }

  // Unlocks with a prompted password when needed. Returns the password so the
  // caller can re-verify it, or an exit code on failure.
  std::optional<int> UnlockInteractive(sg::auth::SessionStateMachine& session,
                                       std::optional<Secret>& password) {
    if (!session.Status().protection_enabled) {
      if (session.State() == sg::auth::SessionState::kLocked) {
        const int code = ReportAuthResult(session.Login({}));
        if (code != kExitOk) {
          return code;
        }
      }
      return std::nullopt;
    }
    password.emplace(ReadSecret("Password: "));
    const auto result = session.Login(password->value);
    const int code = ReportAuthResult(result);
    if (code != kExitOk) {
      return code;
    }
    return std::nullopt;
  }

  std::optional<bool> ParseOnOff(std::string_view value) {
    if (value == "on") {
      return true;
    }
    if (value == "off") {
      return false;
    }
    return std::nullopt;
  }

  int HandleStatus(sg::auth::SessionStateMachine& session) {
    PrintStatus(session.Status());
    return kExitOk;
  }

  int HandleSetup(sg::auth::SessionStateMachine& session) {
    if (session.Status().protection_enabled) {
      throw sg::Error{sg::ErrorDomain::State, sg::errors::auth::kCredentialAlreadySet,
                      std::string(sg::errors::msg::kCredentialAlreadySet)};
    }
    std::optional<Secret> unused;
    if (auto code = UnlockInteractive(session, unused)) {
      return *code;
    }
    Secret password = ReadNewPassword();
    auto key = session.SetupPassword(password.value);
    std::cout << "Password protection enabled." << std::endl;
    PrintRecoveryKey(key);
    return kExitOk;
  }

  int HandleLogin(sg::auth::SessionStateMachine& session) {
    if (!session.Status().protection_enabled) {
      std::cout << "No password is configured; the session is open." << std::endl;
      return kExitOk;
    }
    Secret password(ReadSecret("Password: "));
    return ReportAuthResult(session.Login(password.value));
  }

  int HandleRecover(sg::auth::SessionStateMachine& session) {
    Secret candidate(ReadSecret("Recovery key: "));
    auto redemption = session.BeginRecovery(candidate.value);
    if (!redemption.result.ok() || !redemption.ticket) {
      return ReportAuthResult(redemption.result);
    }
    std::cout << "Recovery key accepted. Choose a new password." << std::endl;
    Secret password = ReadNewPassword();
    auto key = session.CompleteRecovery(*redemption.ticket, password.value);
    std::cout << "Password reset." << std::endl;
    PrintRecoveryKey(key);
    return kExitOk;
  }

  int HandleChangePassword(sg::auth::SessionStateMachine& session) {
    std::optional<Secret> current;
    if (auto code = UnlockInteractive(session, current)) {
      return *code;
    }
    if (!current) {
      throw sg::Error{sg::ErrorDomain::State, sg::errors::auth::kNoCredentialSet,
                      std::string(sg::errors::msg::kNoCredentialSet)};
    }
    Secret password = ReadNewPassword();
    auto change = session.ChangePassword(current->value, password.value);
    if (!change.result.ok() || !change.recovery_key) {
      return ReportAuthResult(change.result);
    }
    std::cout << "Password changed." << std::endl;
    PrintRecoveryKey(*change.recovery_key);
    return kExitOk;
  }

  int HandleDisable(sg::auth::SessionStateMachine& session) {
    std::optional<Secret> current;
    if (auto code = UnlockInteractive(session, current)) {
      return *code;
    }
    if (!current) {
      throw sg::Error{sg::ErrorDomain::State, sg::errors::auth::kNoCredentialSet,
                      std::string(sg::errors::msg::kNoCredentialSet)};
    }
    const auto result = session.DisableProtection(current->value);
    if (!result.ok()) {
      return ReportAuthResult(result);
    }
    std::cout << "Password protection disabled." << std::endl;
    return kExitOk;
  }

  int HandleAutoLock(sg::auth::SessionStateMachine& session, bool enabled,
                     std::optional<uint32_t> timeout) {
    std::optional<Secret> current;
    if (auto code = UnlockInteractive(session, current)) {
      return *code;
    }
    const uint32_t seconds = timeout.value_or(session.Status().auto_lock_timeout_seconds);
    session.ConfigureAutoLock(enabled, seconds);
    std::cout << "Auto-lock " << (enabled ? "on" : "off") << " (" << seconds << "s)." << std::endl;
    return kExitOk;
  }

  int HandleOsLock(sg::auth::SessionStateMachine& session, bool enabled) {
    std::optional<Secret> current;
    if (auto code = UnlockInteractive(session, current)) {
      return *code;
    }
    session.ConfigureOsLockIntegration(enabled);
    std::cout << "OS lock integration " << (enabled ? "on" : "off") << "." << std::endl;
    return kExitOk;
  }

  // Keeps the OS event source attached for the lifetime of the run loop.
  class AttachedEventSource {
   public:
    explicit AttachedEventSource(sg::auth::SessionStateMachine& session)
        : session_(session), source_(sg::auth::CreatePlatformSessionEventSource()) {
      if (source_) {
        session_.AttachSessionEventSource(*source_);
      }
    }
    ~AttachedEventSource() {
      if (source_) {
        session_.DetachSessionEventSource();
      }
    }
    AttachedEventSource(const AttachedEventSource&) = delete;
    AttachedEventSource& operator=(const AttachedEventSource&) = delete;

    [[nodiscard]] bool available() const noexcept { return source_ != nullptr; }

   private:
    sg::auth::SessionStateMachine& session_;
    std::unique_ptr<sg::auth::SessionEventSource> source_;
  };

  int HandleRun(sg::auth::SessionStateMachine& session) {
    const auto observer = session.Subscribe([](const sg::auth::SessionTransition& t) {
      std::cout << "[" << FormatTime(t.at) << "] " << sg::auth::ToString(t.previous) << " -> "
                << sg::auth::ToString(t.current) << " (" << sg::auth::ToString(t.cause);
      if (t.os_event) {
        std::cout << ": " << sg::auth::ToString(*t.os_event);
      }
      std::cout << ")" << std::endl;
    });

    AttachedEventSource os_events(session);
    if (!os_events.available()) {
      std::cerr << "No OS session notifications on this host; idle and manual lock only."
                << std::endl;
    }
    session.StartIdleChecks();
    std::cout << "Session running (" << sg::auth::ToString(session.State())
              << "). Commands: activity, lock, unlock, status, quit." << std::endl;

    std::string line;
    while (std::getline(std::cin, line)) {
      if (line == "quit") {
        break;
      }
      session.NotifyActivity();
      if (line.empty() || line == "activity") {
        continue;
      }
      if (line == "lock") {
        const auto sequence = session.RequestLock(sg::auth::LockSource::kManual);
        if (!session.WaitUntilProcessed(sequence, std::chrono::seconds(1))) {
          std::cerr << "Lock request still pending." << std::endl;
        }
        continue;
      }
      if (line == "unlock") {
        try {
          if (session.Status().protection_enabled) {
            Secret password(ReadSecret("Password: "));
            ReportAuthResult(session.Login(password.value));
          } else {
            ReportAuthResult(session.Login({}));
          }
        } catch (const sg::Error& err) {
          ReportError(err);
        }
        continue;
      }
      if (line == "status") {
        PrintStatus(session.Status());
        continue;
      }
      std::cerr << "Unknown command: " << line << std::endl;
    }

    session.StopIdleChecks();
    session.Unsubscribe(observer);
    return kExitOk;
  }

  std::optional<uint64_t> ParseUnsigned(std::string_view text, uint64_t max_value) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size() || value > max_value) {
      return std::nullopt;
    }
    return value;
  }

} // namespace

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      PrintUsage();
      return kExitUsage;
    }

    auto config = sg::auth::AuthConfig::FromEnvironment();
    int index = 1;
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        break;
      }
      if (arg.rfind("--state-dir=", 0) == 0) {
        auto value = arg.substr(std::string_view("--state-dir=").size());
        if (value.empty()) {
          PrintUsage();
          return kExitUsage;
        }
        config.state_dir = std::filesystem::path(std::string(value));
        continue;
      }
      if (arg.rfind("--hash-cost=", 0) == 0) {
        auto value = arg.substr(std::string_view("--hash-cost=").size());
        config.hash_cost = static_cast<int>(sg::auth::ParseConfigNumber(
            "--hash-cost", value, sg::auth::PasswordHasher::kMinCost,
            sg::auth::PasswordHasher::kMaxCost));
        continue;
      }
      if (arg == "--no-audit-log") {
        config.audit_log_enabled = false;
        continue;
      }
      PrintUsage();
      return kExitUsage;
    }
    config.Validate();

    if (index >= argc) {
      PrintUsage();
      return kExitUsage;
    }
    const std::string cmd = argv[index++];

    if (config.audit_log_enabled) {
      sg::orchestrator::EventBus::Instance().AttachJsonLog(config.audit_log_path());
    }

    sg::auth::FileAuthSettingsStore backend(config.settings_path());
    sg::auth::CredentialStore store(backend);
    sg::auth::PasswordHasher hasher(config.hash_cost);
    sg::auth::SessionOptions options;
    options.lockout = config.lockout();
    options.idle_check_interval = config.idle_check_interval;
    sg::auth::SessionStateMachine session(store, hasher, options);

    if (cmd == "status" && index == argc) {
      return HandleStatus(session);
    }
    if (cmd == "setup" && index == argc) {
      return HandleSetup(session);
    }
    if (cmd == "login" && index == argc) {
      return HandleLogin(session);
    }
    if (cmd == "recover" && index == argc) {
      return HandleRecover(session);
    }
    if (cmd == "change-password" && index == argc) {
      return HandleChangePassword(session);
    }
    if (cmd == "disable" && index == argc) {
      return HandleDisable(session);
    }
    if (cmd == "auto-lock") {
      if (argc - index < 1 || argc - index > 2) {
        PrintUsage();
        return kExitUsage;
      }
      auto enabled = ParseOnOff(argv[index]);
      if (!enabled) {
        PrintUsage();
        return kExitUsage;
      }
      std::optional<uint32_t> timeout;
      if (argc - index == 2) {
        std::string_view arg = argv[index + 1];
        if (arg.rfind("--timeout=", 0) != 0) {
          PrintUsage();
          return kExitUsage;
        }
        auto parsed = ParseUnsigned(arg.substr(std::string_view("--timeout=").size()), UINT32_MAX);
        if (!parsed || *parsed == 0) {
          PrintUsage();
          return kExitUsage;
        }
        timeout = static_cast<uint32_t>(*parsed);
      }
      return HandleAutoLock(session, *enabled, timeout);
    }
    if (cmd == "os-lock") {
      if (argc - index != 1) {
        PrintUsage();
        return kExitUsage;
      }
      auto enabled = ParseOnOff(argv[index]);
      if (!enabled) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleOsLock(session, *enabled);
    }
    if (cmd == "run" && index == argc) {
      return HandleRun(session);
    }

    PrintUsage();
    return kExitUsage;
  } catch (const sg::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
#ifdef NDEBUG
    std::cerr << "I/O error: Operation failed." << std::endl;
#else
    std::cerr << "I/O error: " << err.what() << std::endl;
#endif
    return kExitIO;
  }
}
