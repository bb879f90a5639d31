#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>

namespace sg::crypto {

// Primitive backend used by the hashing and integrity code.
class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) = 0;

  virtual std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) = 0;

  virtual void PBKDF2HMACSHA256(std::span<const uint8_t> password,
                                std::span<const uint8_t> salt,
                                uint32_t iterations,
                                std::span<uint8_t> out) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) override;

  std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) override;

  void PBKDF2HMACSHA256(std::span<const uint8_t> password,
                        std::span<const uint8_t> salt,
                        uint32_t iterations,
                        std::span<uint8_t> out) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
CryptoProvider& GetCryptoProvider();
// Runs the known-answer self test once per process. Throws sg::Error on mismatch.
void EnsureCryptoProviderInitialized();

}  // namespace sg::crypto
