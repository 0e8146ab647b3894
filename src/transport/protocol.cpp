#include "nr/transport/protocol.h"

#include <json/json.h>

#include <chrono>
#include <memory>

#include "nr/error.h"
#include "nr/errors.h"

namespace nr::transport {

namespace {

[[noreturn]] void ThrowMalformed() {
  throw TransportError(errors::transport::kMalformedMessage,
                       std::string(errors::msg::kMalformedMessage));
}

std::string Write(const Json::Value& value) {
  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  writer["emitUTF8"] = true;
  return Json::writeString(writer, value);
}

std::optional<std::string> OptionalString(const Json::Value& root, const char* key) {
  if (!root.isMember(key)) {
    return std::nullopt;
  }
  const Json::Value& value = root[key];
  if (!value.isString()) {
    ThrowMalformed();
  }
  return value.asString();
}

std::int64_t ToUnixSeconds(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

}  // namespace

ClientMessage ParseClientMessage(std::string_view text) {
  if (text.size() > kMaxClientMessageBytes) {
    throw TransportError(errors::transport::kMessageTooLarge,
                         std::string(errors::msg::kMessageTooLarge));
  }
  Json::CharReaderBuilder builder;
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errs;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs) || !root.isObject()) {
    ThrowMalformed();
  }
  const auto type = OptionalString(root, "type");
  if (!type) {
    ThrowMalformed();
  }

  ClientMessage message;
  if (*type == "auth") {
    message.type = ClientMessageType::kAuth;
    message.password = OptionalString(root, "password");
    message.token = OptionalString(root, "token");
    if (message.password.has_value() == message.token.has_value()) {
      ThrowMalformed();
    }
  } else if (*type == "command") {
    message.type = ClientMessageType::kCommand;
    message.command = OptionalString(root, "command");
    if (root.isMember("argv")) {
      const Json::Value& argv = root["argv"];
      if (!argv.isArray()) {
        ThrowMalformed();
      }
      std::vector<std::string> items;
      items.reserve(argv.size());
      for (const auto& item : argv) {
        if (!item.isString()) {
          ThrowMalformed();
        }
        items.push_back(item.asString());
      }
      message.argv = std::move(items);
    }
    if (message.command.has_value() == message.argv.has_value()) {
      ThrowMalformed();
    }
    message.cwd = OptionalString(root, "cwd");
  } else if (*type == "cancel") {
    message.type = ClientMessageType::kCancel;
    message.job_id = OptionalString(root, "job_id");
  } else if (*type == "status") {
    message.type = ClientMessageType::kStatus;
  } else {
    ThrowMalformed();
  }
  return message;
}

std::string AuthResultMessage(const auth::Identity& identity, const std::string* token) {
  Json::Value root(Json::objectValue);
  root["type"] = "authResult";
  root["ok"] = true;
  if (token) {
    root["token"] = *token;
  }
  root["subject"] = identity.subject;
  root["role"] = identity.role;
  root["expires_at"] = Json::Int64{identity.expires_at};
  return Write(root);
}

std::string AuthFailureMessage(std::string_view reason, std::optional<std::int64_t> retry_after) {
  Json::Value root(Json::objectValue);
  root["type"] = "authResult";
  root["ok"] = false;
  root["reason"] = std::string(reason);
  if (retry_after) {
    root["retry_after"] = Json::Int64{*retry_after};
  }
  return Write(root);
}

std::string JobStartedMessage(const exec::JobId& job_id, const std::string& program) {
  Json::Value root(Json::objectValue);
  root["type"] = "jobStarted";
  root["job_id"] = job_id;
  root["program"] = program;
  return Write(root);
}

std::string OutputChunkMessage(const exec::OutputEvent& event) {
  Json::Value root(Json::objectValue);
  root["type"] = "outputChunk";
  root["job_id"] = event.job_id;
  root["stream"] = std::string(exec::OutputStreamName(event.stream));
  root["data"] = ToValidUtf8(event.chunk.text);
  root["redacted"] = Json::UInt64{event.chunk.redacted_count};
  return Write(root);
}

std::string ExitResultMessage(const exec::ExitEvent& event) {
  Json::Value root(Json::objectValue);
  root["type"] = "exitResult";
  root["job_id"] = event.job_id;
  root["state"] = std::string(exec::JobStateName(event.state));
  if (event.exit_code) {
    root["code"] = *event.exit_code;
  }
  if (event.signal) {
    root["signal"] = *event.signal;
  }
  root["reason"] = event.reason;
  return Write(root);
}

std::string StatusMessage(std::string_view state, const std::vector<exec::JobRecord>& jobs) {
  Json::Value root(Json::objectValue);
  root["type"] = "status";
  root["state"] = std::string(state);
  Json::Value list(Json::arrayValue);
  for (const auto& job : jobs) {
    Json::Value item(Json::objectValue);
    item["job_id"] = job.id;
    item["program"] = job.program;
    item["state"] = std::string(exec::JobStateName(job.state));
    item["started_at"] = Json::Int64{ToUnixSeconds(job.started_at)};
    if (job.finished_at) {
      item["finished_at"] = Json::Int64{ToUnixSeconds(*job.finished_at)};
    }
    if (job.exit_code) {
      item["code"] = *job.exit_code;
    }
    if (!job.reason.empty()) {
      item["reason"] = job.reason;
    }
    list.append(item);
  }
  root["jobs"] = list;
  return Write(root);
}

std::string ErrorMessage(std::string_view reason, std::string_view message) {
  Json::Value root(Json::objectValue);
  root["type"] = "error";
  root["reason"] = std::string(reason);
  root["message"] = std::string(message);
  return Write(root);
}

std::string ToValidUtf8(std::string_view bytes) {
  static constexpr char kReplacement[] = "\xEF\xBF\xBD";
  std::string out;
  out.reserve(bytes.size());
  size_t i = 0;
  while (i < bytes.size()) {
    const auto lead = static_cast<unsigned char>(bytes[i]);
    size_t length = 0;
    uint32_t min_code = 0;
    if (lead < 0x80) {
      out.push_back(static_cast<char>(lead));
      ++i;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      length = 2;
      min_code = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      min_code = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      min_code = 0x10000;
    }
    bool valid = length != 0 && i + length <= bytes.size();
    uint32_t code = valid ? (lead & (0xFF >> (length + 1))) : 0;
    for (size_t k = 1; valid && k < length; ++k) {
      const auto next = static_cast<unsigned char>(bytes[i + k]);
      if ((next & 0xC0) != 0x80) {
        valid = false;
      } else {
        code = (code << 6) | (next & 0x3F);
      }
    }
    if (valid && (code < min_code || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF))) {
      valid = false;
    }
    if (valid) {
      out.append(bytes.substr(i, length));
      i += length;
    } else {
      out.append(kReplacement);
      ++i;
    }
  }
  return out;
}

}  // namespace nr::transport
