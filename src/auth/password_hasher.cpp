#include "sg/auth/password_hasher.h"

#include <array>
#include <charconv>
#include <optional>
#include <span>
#include <string>

#include "sg/common.h"
#include "sg/crypto/ct.h"
#include "sg/crypto/provider.h"
#include "sg/crypto/random.h"
#include "sg/error.h"
#include "sg/errors.h"
#include "sg/orchestrator/event_bus.h"
#include "sg/security/zeroizer.h"

namespace sg::auth {
namespace {

using Salt = std::array<uint8_t, PasswordHasher::kSaltSize>;
using DerivedKey = std::array<uint8_t, PasswordHasher::kHashSize>;

struct ParsedDigest {
  int cost{0};
  Salt salt{};
  DerivedKey hash{};
};

void AppendHex(std::string& out, std::span<const uint8_t> bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (uint8_t byte : bytes) {
    out.push_back(kHex[(byte >> 4) & 0x0F]);
    out.push_back(kHex[byte & 0x0F]);
  }
}

bool DecodeHex(std::string_view text, std::span<uint8_t> out) {
  if (text.size() != out.size() * 2) {
    return false;
  }
  auto nibble = [](char ch) -> int {
    if (ch >= '0' && ch <= '9') {
      return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
      return 10 + (ch - 'a');
    }
    return -1;
  };
  for (size_t i = 0; i < out.size(); ++i) {
    const int high = nibble(text[i * 2]);
    const int low = nibble(text[i * 2 + 1]);
    if (high < 0 || low < 0) {
      return false;
    }
    out[i] = static_cast<uint8_t>((high << 4) | low);
  }
  return true;
}

std::optional<ParsedDigest> ParseDigest(std::string_view digest) {
  if (digest.substr(0, PasswordHasher::kPrefix.size()) != PasswordHasher::kPrefix) {
    return std::nullopt;
  }
  auto rest = digest.substr(PasswordHasher::kPrefix.size());
  // <cc>$<salt>$<hash>
  if (rest.size() != 2 + 1 + PasswordHasher::kSaltSize * 2 + 1 + PasswordHasher::kHashSize * 2) {
    return std::nullopt;
  }
  ParsedDigest parsed;
  auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + 2, parsed.cost);
  if (ec != std::errc() || ptr != rest.data() + 2 || parsed.cost < PasswordHasher::kMinCost ||
      parsed.cost > PasswordHasher::kMaxCost) {
    return std::nullopt;
  }
  const size_t salt_start = 3;
  const size_t hash_start = salt_start + PasswordHasher::kSaltSize * 2 + 1;
  if (rest[2] != '$' || rest[hash_start - 1] != '$') {
    return std::nullopt;
  }
  if (!DecodeHex(rest.substr(salt_start, PasswordHasher::kSaltSize * 2), parsed.salt) ||
      !DecodeHex(rest.substr(hash_start), parsed.hash)) {
    return std::nullopt;
  }
  return parsed;
}

DerivedKey Derive(std::string_view secret, const Salt& salt, int cost) {
  DerivedKey out{};
  crypto::GetCryptoProvider().PBKDF2HMACSHA256(
      sg::AsBytes(secret), std::span<const uint8_t>(salt.data(), salt.size()),
      PasswordHasher::IterationsForCost(cost), std::span<uint8_t>(out.data(), out.size()));
  return out;
}

void ReportMalformedDigest(std::string_view reason) {
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kSecurity;
  event.severity = orchestrator::EventSeverity::kWarning;
  event.event_id = "credential_digest_malformed";
  event.message = "Stored credential digest could not be parsed";
  event.fields.emplace_back("reason", std::string(reason));
  orchestrator::EventBus::Instance().Publish(event);
}

}  // namespace

PasswordHasher::PasswordHasher(int cost) : cost_(cost) {
  if (cost < kMinCost || cost > kMaxCost) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                std::string(errors::msg::kHashCostOutOfRange) + ": " + std::to_string(cost));
  }
}

uint32_t PasswordHasher::IterationsForCost(int cost) {
  if (cost < kMinCost || cost > kMaxCost) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                std::string(errors::msg::kHashCostOutOfRange));
  }
  return (uint32_t{1} << cost) * kIterationsPerRound;
}

std::string PasswordHasher::Hash(std::string_view secret) const {
  Salt salt{};
  crypto::SystemRandomBytes(std::span<uint8_t>(salt.data(), salt.size()));
  DerivedKey derived = Derive(secret, salt, cost_);
  security::Zeroizer::ScopeWiper<uint8_t> derived_guard(derived.data(), derived.size());

  std::string digest;
  digest.reserve(kPrefix.size() + 3 + kSaltSize * 2 + 1 + kHashSize * 2);
  digest.append(kPrefix);
  if (cost_ < 10) {
    digest.push_back('0');
  }
  digest.append(std::to_string(cost_));
  digest.push_back('$');
  AppendHex(digest, salt);
  digest.push_back('$');
  AppendHex(digest, derived);
  return digest;
}

bool PasswordHasher::Verify(std::string_view secret, std::string_view digest) const {
  auto parsed = ParseDigest(digest);
  if (!parsed) {
    ReportMalformedDigest(digest.empty() ? "empty" : "format");
    return false;
  }
  security::Zeroizer::ScopeWiper<uint8_t> stored_guard(parsed->hash.data(), parsed->hash.size());
  DerivedKey candidate = Derive(secret, parsed->salt, parsed->cost);
  security::Zeroizer::ScopeWiper<uint8_t> candidate_guard(candidate.data(), candidate.size());
  return crypto::ct::CompareEqual(candidate, parsed->hash);
}

bool PasswordHasher::NeedsRehash(std::string_view digest) const {
  auto parsed = ParseDigest(digest);
  return !parsed || parsed->cost != cost_;
}

}  // namespace sg::auth
