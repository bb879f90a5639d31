#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace sg::auth {

// Salted adaptive-cost one-way hashing for passwords and recovery keys.
//
// Digests are self-describing text:
//   $sg-pbkdf2-sha256$<cc>$<salt-hex>$<hash-hex>
// where <cc> is a two digit log2 cost. One cost unit is 2^cc rounds of 64
// PBKDF2-HMAC-SHA256 iterations, so the default cost 12 runs 262144
// iterations. The cost is read back from the digest, so raising the
// configured cost never invalidates stored digests.
class PasswordHasher {
 public:
  static constexpr int kDefaultCost = 12;
  static constexpr int kMinCost = 4;
  static constexpr int kMaxCost = 20;
  static constexpr std::size_t kSaltSize = 16;
  static constexpr std::size_t kHashSize = 32;
  static constexpr uint32_t kIterationsPerRound = 64;
  static constexpr std::string_view kPrefix = "$sg-pbkdf2-sha256$";

  // Throws sg::Error{Config} when |cost| is outside [kMinCost, kMaxCost].
  explicit PasswordHasher(int cost = kDefaultCost);

  // Every call draws a fresh salt.
  [[nodiscard]] std::string Hash(std::string_view secret) const;

  // Malformed digests verify as false and are reported on the event bus.
  [[nodiscard]] bool Verify(std::string_view secret, std::string_view digest) const;

  [[nodiscard]] bool NeedsRehash(std::string_view digest) const;

  [[nodiscard]] int cost() const noexcept { return cost_; }

  static uint32_t IterationsForCost(int cost);

 private:
  int cost_;
};

}  // namespace sg::auth
