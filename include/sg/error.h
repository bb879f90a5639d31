#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sg {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // platform error numbers. Codes inside the reserved range are stable across
  // releases.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kConsoleModeQueryFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kConsoleEchoDisableFailed = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kPasswordReadFailed = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kPasswordPromptNeedsTty = Make(ErrorDomain::IO, 0x05);
      inline constexpr int kSettingsWriteFailed = Make(ErrorDomain::IO, 0x09);
      inline constexpr int kSettingsReadFailed = Make(ErrorDomain::IO, 0x0A);
      inline constexpr int kSignalPipeFailed = Make(ErrorDomain::IO, 0x0B);
    } // namespace io

    namespace validation {
      inline constexpr int kPasswordPolicy = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kPasswordMismatch = Make(ErrorDomain::Validation, 0x03);
    } // namespace validation

    namespace config {
      inline constexpr int kInvalidValue = Make(ErrorDomain::Config, 0x01);
    } // namespace config

    namespace auth {
      inline constexpr int kCorruptStore = Make(ErrorDomain::State, 0x01);
      inline constexpr int kCredentialAlreadySet = Make(ErrorDomain::State, 0x02);
      inline constexpr int kNoCredentialSet = Make(ErrorDomain::State, 0x03);
      inline constexpr int kSessionLocked = Make(ErrorDomain::State, 0x04);
      inline constexpr int kResetTicketInvalid = Make(ErrorDomain::Security, 0x04);
    } // namespace auth

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };
} // namespace sg
