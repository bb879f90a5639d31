#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "sg/auth/password_hasher.h"

namespace sg::auth {

// No O, I, 0 or 1.
inline constexpr std::string_view kRecoveryAlphabet = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
inline constexpr size_t kRecoverySymbols = 16;
inline constexpr size_t kRecoveryGroupSize = 4;
// XXXX-XXXX-XXXX-XXXX
inline constexpr size_t kRecoveryKeyTextLength =
    kRecoverySymbols + kRecoverySymbols / kRecoveryGroupSize - 1;

std::string GenerateRecoveryKeyText();

// Canonical grouped form, or an empty string when |candidate| is not a
// recovery key. Accepts lower case, surrounding whitespace and the ungrouped
// form.
std::string NormalizeRecoveryKey(std::string_view candidate);

// A freshly issued key. The plaintext is wiped on destruction.
class IssuedRecoveryKey {
 public:
  IssuedRecoveryKey(std::string plaintext, std::string hash);
  ~IssuedRecoveryKey();

  IssuedRecoveryKey(const IssuedRecoveryKey&) = delete;
  IssuedRecoveryKey& operator=(const IssuedRecoveryKey&) = delete;
  IssuedRecoveryKey(IssuedRecoveryKey&& other) noexcept;
  IssuedRecoveryKey& operator=(IssuedRecoveryKey&& other) noexcept;

  [[nodiscard]] std::string_view Plaintext() const noexcept { return plaintext_; }
  [[nodiscard]] const std::string& Hash() const noexcept { return hash_; }

 private:
  std::string plaintext_;
  std::string hash_;
};

class RecoveryFlow {
 public:
  explicit RecoveryFlow(const PasswordHasher& hasher) : hasher_(hasher) {}

  [[nodiscard]] IssuedRecoveryKey Issue() const;
  [[nodiscard]] bool Redeem(std::string_view candidate, std::string_view stored_hash) const;

 private:
  const PasswordHasher& hasher_;
};

class SessionStateMachine;

// Proof of a successful recovery-key redemption. Single use; invalidated by
// any credential change made after it was issued.
class CredentialResetTicket {
 public:
  CredentialResetTicket(const CredentialResetTicket&) = delete;
  CredentialResetTicket& operator=(const CredentialResetTicket&) = delete;
  CredentialResetTicket(CredentialResetTicket&& other) noexcept : serial_(other.serial_) {
    other.serial_ = 0;
  }
  CredentialResetTicket& operator=(CredentialResetTicket&& other) noexcept {
    if (this != &other) {
      serial_ = other.serial_;
      other.serial_ = 0;
    }
    return *this;
  }

  [[nodiscard]] bool empty() const noexcept { return serial_ == 0; }

 private:
  friend class SessionStateMachine;
  explicit CredentialResetTicket(uint64_t serial) noexcept : serial_(serial) {}

  uint64_t serial_{0};
};

}  // namespace sg::auth
