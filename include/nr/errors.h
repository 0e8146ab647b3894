#pragma once

#include <string_view>

namespace nr::errors::msg {
// TSK111_Code_Duplication_and_Maintainability centralized message catalog
// Client-visible text. Nothing here may be built from request data.
inline constexpr std::string_view kAuthenticationFailed{"Authentication failed"};
inline constexpr std::string_view kTokenExpired{"Session token expired"};
inline constexpr std::string_view kTokenInvalid{"Session token invalid"};
inline constexpr std::string_view kTokenRevoked{"Session token revoked"};
inline constexpr std::string_view kLocalOnly{"Remote connections require a configured signing secret"};
inline constexpr std::string_view kProgramNotAllowed{"Program is not on the allowlist"};
inline constexpr std::string_view kMetacharacterDetected{"Argument contains a shell metacharacter"};
inline constexpr std::string_view kTraversalDetected{"Argument contains a path traversal component"};
inline constexpr std::string_view kTooManyArguments{"Too many arguments"};
inline constexpr std::string_view kArgumentTooLong{"Argument too long"};
inline constexpr std::string_view kWorkingDirectoryInvalid{"Working directory is not usable"};
inline constexpr std::string_view kEmptyCommand{"Command is empty"};
inline constexpr std::string_view kMalformedCommand{"Command could not be parsed"};
inline constexpr std::string_view kSpawnFailed{"Process could not be started"};
inline constexpr std::string_view kJobNotFound{"Job not found"};
inline constexpr std::string_view kConcurrencyLimit{"Too many concurrent jobs"};
inline constexpr std::string_view kSessionBusy{"A job is already running in this session"};
inline constexpr std::string_view kMalformedMessage{"Message could not be parsed"};
inline constexpr std::string_view kUnexpectedMessage{"Message not valid in the current state"};
inline constexpr std::string_view kOriginRejected{"Origin not allowed"};
inline constexpr std::string_view kMessageTooLarge{"Message too large"};
inline constexpr std::string_view kIdleTimeout{"Session idle timeout"};
inline constexpr std::string_view kInternalError{"Internal error"};
inline constexpr std::string_view kSigningSecretTooShort{"Signing secret must be at least 32 characters"};
inline constexpr std::string_view kPasswordMissing{"A session password must be configured"};
inline constexpr std::string_view kTlsPairIncomplete{"TLS certificate and key must be configured together"};
}  // namespace nr::errors::msg
