#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nr {
  // TSK020
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Execution = 0x06,
    Transport = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // platform error numbers. Codes inside the reserved range are stable across
  // releases and are what clients see. // TSK020
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
    case ErrorDomain::Execution:
      return 0x0600;
    case ErrorDomain::Transport:
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

  enum class Retryability : std::uint8_t {  // TSK109_Error_Code_Handling
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    // Helper to construct reserved error codes. // TSK020
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace auth {
      inline constexpr int kInvalidCredentials = Make(ErrorDomain::Security, 0x01);
      inline constexpr int kRateLimited = Make(ErrorDomain::Security, 0x02);
      inline constexpr int kTokenExpired = Make(ErrorDomain::Security, 0x03);
      inline constexpr int kTokenMalformed = Make(ErrorDomain::Security, 0x04);
      inline constexpr int kTokenRevoked = Make(ErrorDomain::Security, 0x05);
      inline constexpr int kLocalOnly = Make(ErrorDomain::Security, 0x06);
    } // namespace auth

    namespace validation {
      inline constexpr int kDisallowedProgram = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kMetacharacterDetected = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kTraversalDetected = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kTooManyArguments = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kArgumentTooLong = Make(ErrorDomain::Validation, 0x05);
      inline constexpr int kWorkingDirectoryInvalid = Make(ErrorDomain::Validation, 0x06);
      inline constexpr int kEmptyCommand = Make(ErrorDomain::Validation, 0x07);
      inline constexpr int kMalformedCommand = Make(ErrorDomain::Validation, 0x08);
    } // namespace validation

    namespace execution {
      inline constexpr int kSpawnFailed = Make(ErrorDomain::Execution, 0x01);
      inline constexpr int kNotFound = Make(ErrorDomain::Execution, 0x02);
      inline constexpr int kConcurrencyLimit = Make(ErrorDomain::Execution, 0x03);
      inline constexpr int kSessionBusy = Make(ErrorDomain::Execution, 0x04);
    } // namespace execution

    namespace config {
      inline constexpr int kInvalidValue = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kMissingValue = Make(ErrorDomain::Config, 0x02);
      inline constexpr int kUnreadableFile = Make(ErrorDomain::Config, 0x03);
    } // namespace config

    namespace transport {
      inline constexpr int kMalformedMessage = Make(ErrorDomain::Transport, 0x01);
      inline constexpr int kUnexpectedMessage = Make(ErrorDomain::Transport, 0x02);
      inline constexpr int kOriginRejected = Make(ErrorDomain::Transport, 0x03);
      inline constexpr int kMessageTooLarge = Make(ErrorDomain::Transport, 0x04);
    } // namespace transport

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code; // TSK027
    Retryability retryability{Retryability::kFatal};        // TSK109_Error_Code_Handling classify retries
    std::vector<std::string> context;                       // TSK109_Error_Code_Handling preserve call stack
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

  // Authentication failures. The reason is enumerable; the message shown to a
  // client is always the generic catalog text. // TSK401_Gateway_Auth
  enum class AuthFailure : std::uint8_t {
    kInvalidCredentials,
    kRateLimited,
    kExpired,
    kMalformed,
    kRevoked,
    kLocalOnly
  };

  struct AuthError : public Error {
    AuthFailure reason;
    std::optional<std::int64_t> retry_after_seconds;
    AuthError(AuthFailure r, std::string msg,
              std::optional<std::int64_t> retry_after = std::nullopt);
  };

  // TSK402_Command_Validation
  enum class ValidationFailure : std::uint8_t {
    kDisallowedProgram,
    kMetacharacterDetected,
    kTraversalDetected,
    kTooManyArguments,
    kArgumentTooLong,
    kWorkingDirectoryInvalid,
    kEmptyCommand,
    kMalformedCommand
  };

  struct ValidationError : public Error {
    ValidationFailure reason;
    ValidationError(ValidationFailure r, std::string msg);
  };

  // TSK403_Process_Supervision
  enum class ExecutionFailure : std::uint8_t {
    kSpawnFailed,
    kNotFound,
    kConcurrencyLimit,
    kSessionBusy
  };

  struct ExecutionError : public Error {
    ExecutionFailure reason;
    ExecutionError(ExecutionFailure r, std::string msg, std::optional<int> native = std::nullopt);
  };

  struct TransportError : public Error {
    TransportError(int c, std::string msg) : Error(ErrorDomain::Transport, c, std::move(msg)) {}
  };

  // Stable wire reason strings. // TSK020
  std::string_view ReasonCode(AuthFailure reason) noexcept;
  std::string_view ReasonCode(ValidationFailure reason) noexcept;
  std::string_view ReasonCode(ExecutionFailure reason) noexcept;
  std::string_view TransportReasonCode(int code) noexcept;
} // namespace nr
