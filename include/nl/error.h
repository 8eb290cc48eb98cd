#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace nl {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Dependency = 0x06,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // platform error numbers. Codes inside the reserved range are stable.
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
    case ErrorDomain::Dependency:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0;
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
      inline constexpr int kChunkLoadTimeout = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kChunkLoadFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kImportChunkWriteFailed = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kStateCorrupted = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kStatePersistFailed = Make(ErrorDomain::IO, 0x05);
      inline constexpr int kSourceReadFailed = Make(ErrorDomain::IO, 0x06);
      inline constexpr int kChunkFileMissing = Make(ErrorDomain::IO, 0x07);
      inline constexpr int kSecureWipeFailed = Make(ErrorDomain::IO, 0x08);
    } // namespace io

    namespace validation {
      inline constexpr int kGeometryInvalid = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kOversizeRejected = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kImportFingerprintMismatch = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kChunkOutOfOrder = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kChunkLengthMismatch = Make(ErrorDomain::Validation, 0x05);
      inline constexpr int kManifestInvalid = Make(ErrorDomain::Validation, 0x06);
    } // namespace validation

    namespace state {
      inline constexpr int kReaderClosed = Make(ErrorDomain::State, 0x01);
      inline constexpr int kFinishBeforeComplete = Make(ErrorDomain::State, 0x02);
      inline constexpr int kImportNotFound = Make(ErrorDomain::State, 0x03);
      inline constexpr int kImportClosed = Make(ErrorDomain::State, 0x04);
      inline constexpr int kFileNotFound = Make(ErrorDomain::State, 0x05);
    } // namespace state

    namespace crypto {
      inline constexpr int kChunkAuthenticationFailed = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kSelfTestFailed = Make(ErrorDomain::Crypto, 0x02);
    } // namespace crypto

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
  struct AuthenticationFailureError : public std::runtime_error {
    explicit AuthenticationFailureError(const std::string& msg) : std::runtime_error(msg) {}
  };
} // namespace nl
