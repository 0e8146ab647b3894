#include "nr/error.h"

#include "nr/errors.h"

namespace nr {

namespace {

int CodeFor(AuthFailure reason) {
  switch (reason) {
  case AuthFailure::kInvalidCredentials:
    return errors::auth::kInvalidCredentials;
  case AuthFailure::kRateLimited:
    return errors::auth::kRateLimited;
  case AuthFailure::kExpired:
    return errors::auth::kTokenExpired;
  case AuthFailure::kMalformed:
    return errors::auth::kTokenMalformed;
  case AuthFailure::kRevoked:
    return errors::auth::kTokenRevoked;
  case AuthFailure::kLocalOnly:
    return errors::auth::kLocalOnly;
  }
  return errors::auth::kInvalidCredentials;
}

int CodeFor(ValidationFailure reason) {
  switch (reason) {
  case ValidationFailure::kDisallowedProgram:
    return errors::validation::kDisallowedProgram;
  case ValidationFailure::kMetacharacterDetected:
    return errors::validation::kMetacharacterDetected;
  case ValidationFailure::kTraversalDetected:
    return errors::validation::kTraversalDetected;
  case ValidationFailure::kTooManyArguments:
    return errors::validation::kTooManyArguments;
  case ValidationFailure::kArgumentTooLong:
    return errors::validation::kArgumentTooLong;
  case ValidationFailure::kWorkingDirectoryInvalid:
    return errors::validation::kWorkingDirectoryInvalid;
  case ValidationFailure::kEmptyCommand:
    return errors::validation::kEmptyCommand;
  case ValidationFailure::kMalformedCommand:
    return errors::validation::kMalformedCommand;
  }
  return errors::validation::kMalformedCommand;
}

int CodeFor(ExecutionFailure reason) {
  switch (reason) {
  case ExecutionFailure::kSpawnFailed:
    return errors::execution::kSpawnFailed;
  case ExecutionFailure::kNotFound:
    return errors::execution::kNotFound;
  case ExecutionFailure::kConcurrencyLimit:
    return errors::execution::kConcurrencyLimit;
  case ExecutionFailure::kSessionBusy:
    return errors::execution::kSessionBusy;
  }
  return errors::execution::kSpawnFailed;
}

}  // namespace

AuthError::AuthError(AuthFailure r, std::string msg, std::optional<std::int64_t> retry_after)
    : Error(ErrorDomain::Security, CodeFor(r), std::move(msg), std::nullopt,
            r == AuthFailure::kRateLimited ? Retryability::kTransient : Retryability::kFatal),
      reason(r),
      retry_after_seconds(retry_after) {}

ValidationError::ValidationError(ValidationFailure r, std::string msg)
    : Error(ErrorDomain::Validation, CodeFor(r), std::move(msg)), reason(r) {}

ExecutionError::ExecutionError(ExecutionFailure r, std::string msg, std::optional<int> native)
    : Error(ErrorDomain::Execution, CodeFor(r), std::move(msg), native,
            r == ExecutionFailure::kConcurrencyLimit || r == ExecutionFailure::kSessionBusy
                ? Retryability::kRetryable
                : Retryability::kFatal),
      reason(r) {}

std::string_view ReasonCode(AuthFailure reason) noexcept {
  switch (reason) {
  case AuthFailure::kInvalidCredentials:
  case AuthFailure::kRateLimited:
    // Throttling is not distinguishable from a bad password on the wire.
    return "authentication_failed";
  case AuthFailure::kExpired:
    return "token_expired";
  case AuthFailure::kMalformed:
    return "token_invalid";
  case AuthFailure::kRevoked:
    return "token_revoked";
  case AuthFailure::kLocalOnly:
    return "local_only";
  }
  return "authentication_failed";
}

std::string_view ReasonCode(ValidationFailure reason) noexcept {
  switch (reason) {
  case ValidationFailure::kDisallowedProgram:
    return "disallowed_program";
  case ValidationFailure::kMetacharacterDetected:
    return "metacharacter_detected";
  case ValidationFailure::kTraversalDetected:
    return "traversal_detected";
  case ValidationFailure::kTooManyArguments:
    return "too_many_arguments";
  case ValidationFailure::kArgumentTooLong:
    return "argument_too_long";
  case ValidationFailure::kWorkingDirectoryInvalid:
    return "working_directory_invalid";
  case ValidationFailure::kEmptyCommand:
    return "empty_command";
  case ValidationFailure::kMalformedCommand:
    return "malformed_command";
  }
  return "malformed_command";
}

std::string_view ReasonCode(ExecutionFailure reason) noexcept {
  switch (reason) {
  case ExecutionFailure::kSpawnFailed:
    return "spawn_failed";
  case ExecutionFailure::kNotFound:
    return "job_not_found";
  case ExecutionFailure::kConcurrencyLimit:
    return "concurrency_limit";
  case ExecutionFailure::kSessionBusy:
    return "session_busy";
  }
  return "internal_error";
}

std::string_view TransportReasonCode(int code) noexcept {
  switch (code) {
  case errors::transport::kMalformedMessage:
    return "malformed_message";
  case errors::transport::kUnexpectedMessage:
    return "unexpected_message";
  case errors::transport::kOriginRejected:
    return "origin_rejected";
  case errors::transport::kMessageTooLarge:
    return "message_too_large";
  default:
    return "internal_error";
  }
}

}  // namespace nr
