#include "sg/crypto/provider.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <array>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "sg/common.h"
#include "sg/crypto/ct.h"
#include "sg/error.h"

namespace sg::crypto {

namespace {

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

void ThrowCryptoError(const std::string& message, int code = 0) {
  throw sg::Error(sg::ErrorDomain::Crypto, code, message);
}

std::mutex& ProviderMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<CryptoProvider>& ProviderInstance() {
  static std::shared_ptr<CryptoProvider> instance;
  return instance;
}

// RFC 4231 test case 2.
void RunHmacKnownAnswerTest() {
  static constexpr std::array<uint8_t, 32> kExpected{
      0x5b, 0xdc, 0xc1, 0x46, 0xbf, 0x60, 0x75, 0x4e, 0x6a, 0x04, 0x24,
      0x26, 0x08, 0x95, 0x75, 0xc7, 0x5a, 0x00, 0x3f, 0x08, 0x9d, 0x27,
      0x39, 0x83, 0x9d, 0xec, 0x58, 0xb9, 0x64, 0xec, 0x38, 0x43};
  OpenSSLCryptoProvider provider;
  const auto tag = provider.HMACSHA256(AsBytes("Jefe"), AsBytes("what do ya want for nothing?"));
  if (!ct::CompareEqual(tag, kExpected)) {
    ThrowCryptoError("HMAC-SHA256 KAT mismatch");
  }
}

}  // namespace

std::array<uint8_t, 32> OpenSSLCryptoProvider::HMACSHA256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> message) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), message.data(),
           message.size(), out.data(), &len) == nullptr) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("HMAC(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected HMAC-SHA256 length", static_cast<int>(len));
  }
  return out;
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::SHA256(
    std::span<const uint8_t> data) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_Digest(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected SHA-256 length", static_cast<int>(len));
  }
  return out;
}

void OpenSSLCryptoProvider::PBKDF2HMACSHA256(std::span<const uint8_t> password,
                                             std::span<const uint8_t> salt,
                                             uint32_t iterations,
                                             std::span<uint8_t> out) {
  if (iterations == 0 ||
      iterations > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
    ThrowCryptoError("PBKDF2 iteration count out of range", static_cast<int>(iterations));
  }
  // OpenSSL treats a null password pointer as "no password"; an empty span
  // still needs a valid address.
  static constexpr char kEmpty[1] = {0};
  const char* pass = password.empty() ? kEmpty : reinterpret_cast<const char*>(password.data());
  if (PKCS5_PBKDF2_HMAC(pass, static_cast<int>(password.size()), salt.data(),
                        static_cast<int>(salt.size()), static_cast<int>(iterations),
                        EVP_sha256(), static_cast<int>(out.size()), out.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("PKCS5_PBKDF2_HMAC"));
  }
}

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& provider = ProviderInstance();
  if (!provider) {
    provider = std::make_shared<OpenSSLCryptoProvider>();
  }
  return provider;
}

CryptoProvider& GetCryptoProvider() {
  return *GetCryptoProviderShared();
}

void EnsureCryptoProviderInitialized() {
  static std::once_flag once;
  std::call_once(once, [] { RunHmacKnownAnswerTest(); });
}

}  // namespace sg::crypto
