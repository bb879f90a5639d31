#include "sg/auth/recovery_key.h"

#include <array>
#include <cctype>

#include "sg/crypto/random.h"
#include "sg/security/zeroizer.h"

namespace sg::auth {

static_assert(kRecoveryAlphabet.size() == 32, "recovery alphabet must hold 32 symbols");

std::string GenerateRecoveryKeyText() {
  std::array<uint8_t, kRecoverySymbols> raw{};
  security::Zeroizer::ScopeWiper<uint8_t> raw_guard(raw.data(), raw.size());
  crypto::SystemRandomBytes(std::span<uint8_t>(raw.data(), raw.size()));

  std::string text;
  text.reserve(kRecoveryKeyTextLength);
  for (size_t i = 0; i < raw.size(); ++i) {
    if (i != 0 && i % kRecoveryGroupSize == 0) {
      text.push_back('-');
    }
    text.push_back(kRecoveryAlphabet[raw[i] & 0x1F]);
  }
  return text;
}

std::string NormalizeRecoveryKey(std::string_view candidate) {
  while (!candidate.empty() && std::isspace(static_cast<unsigned char>(candidate.front()))) {
    candidate.remove_prefix(1);
  }
  while (!candidate.empty() && std::isspace(static_cast<unsigned char>(candidate.back()))) {
    candidate.remove_suffix(1);
  }

  std::string symbols;
  symbols.reserve(kRecoverySymbols);
  const bool grouped = candidate.size() == kRecoveryKeyTextLength;
  if (!grouped && candidate.size() != kRecoverySymbols) {
    return {};
  }
  for (size_t i = 0; i < candidate.size(); ++i) {
    const char ch = candidate[i];
    if (grouped && (i + 1) % (kRecoveryGroupSize + 1) == 0) {
      if (ch != '-') {
        security::Zeroizer::WipeString(symbols);
        return {};
      }
      continue;
    }
    const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    if (kRecoveryAlphabet.find(upper) == std::string_view::npos) {
      security::Zeroizer::WipeString(symbols);
      return {};
    }
    symbols.push_back(upper);
  }

  std::string normalized;
  normalized.reserve(kRecoveryKeyTextLength);
  for (size_t i = 0; i < symbols.size(); ++i) {
    if (i != 0 && i % kRecoveryGroupSize == 0) {
      normalized.push_back('-');
    }
    normalized.push_back(symbols[i]);
  }
  security::Zeroizer::WipeString(symbols);
  return normalized;
}

IssuedRecoveryKey::IssuedRecoveryKey(std::string plaintext, std::string hash)
    : plaintext_(std::move(plaintext)), hash_(std::move(hash)) {}

IssuedRecoveryKey::~IssuedRecoveryKey() {
  security::Zeroizer::WipeString(plaintext_);
}

IssuedRecoveryKey::IssuedRecoveryKey(IssuedRecoveryKey&& other) noexcept
    : plaintext_(std::move(other.plaintext_)), hash_(std::move(other.hash_)) {
  security::Zeroizer::WipeString(other.plaintext_);
}

IssuedRecoveryKey& IssuedRecoveryKey::operator=(IssuedRecoveryKey&& other) noexcept {
  if (this != &other) {
    security::Zeroizer::WipeString(plaintext_);
    plaintext_ = std::move(other.plaintext_);
    hash_ = std::move(other.hash_);
    security::Zeroizer::WipeString(other.plaintext_);
  }
  return *this;
}

IssuedRecoveryKey RecoveryFlow::Issue() const {
  std::string plaintext = GenerateRecoveryKeyText();
  std::string hash = hasher_.Hash(plaintext);
  return IssuedRecoveryKey(std::move(plaintext), std::move(hash));
}

bool RecoveryFlow::Redeem(std::string_view candidate, std::string_view stored_hash) const {
  std::string normalized = NormalizeRecoveryKey(candidate);
  if (normalized.empty()) {
    return false;
  }
  const bool ok = hasher_.Verify(normalized, stored_hash);
  security::Zeroizer::WipeString(normalized);
  return ok;
}

}  // namespace sg::auth
