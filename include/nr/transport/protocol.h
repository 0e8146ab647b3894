#pragma once
// TSK406_Gateway_Protocol JSON message codec for the gateway channel

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nr/auth/token.h"
#include "nr/exec/process_supervisor.h"

namespace nr::transport {

inline constexpr size_t kMaxClientMessageBytes = 64 * 1024;

enum class ClientMessageType : std::uint8_t { kAuth, kCommand, kCancel, kStatus };

struct ClientMessage {
  ClientMessageType type{ClientMessageType::kStatus};
  std::optional<std::string> password;
  std::optional<std::string> token;
  std::optional<std::string> command;
  std::optional<std::vector<std::string>> argv;
  std::optional<std::string> cwd;
  std::optional<std::string> job_id;
};

// Throws TransportError{kMalformedMessage} or {kMessageTooLarge}.
ClientMessage ParseClientMessage(std::string_view text);

// Server -> client. Every builder returns one compact JSON object.
std::string AuthResultMessage(const auth::Identity& identity, const std::string* token);
std::string AuthFailureMessage(std::string_view reason, std::optional<std::int64_t> retry_after);
std::string JobStartedMessage(const exec::JobId& job_id, const std::string& program);
std::string OutputChunkMessage(const exec::OutputEvent& event);
std::string ExitResultMessage(const exec::ExitEvent& event);
std::string StatusMessage(std::string_view state, const std::vector<exec::JobRecord>& jobs);
std::string ErrorMessage(std::string_view reason, std::string_view message);

// Replaces invalid UTF-8 sequences with U+FFFD; process output is arbitrary bytes.
std::string ToValidUtf8(std::string_view bytes);

}  // namespace nr::transport
