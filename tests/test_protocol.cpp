#include "nr/error.h"
#include "nr/transport/protocol.h" // TSK406_Gateway_Protocol
#include "nr/transport/websocket_server.h"

#include <json/json.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using nr::TransportError;
using nr::transport::ClientMessageType;
using nr::transport::ParseClientMessage;

Json::Value Parse(const std::string& text) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errs;
  const bool ok = reader->parse(text.data(), text.data() + text.size(), &root, &errs);
  assert(ok);
  return root;
}

int ParseErrorCode(const std::string& text) {
  try {
    (void)ParseClientMessage(text);
  } catch (const TransportError& err) {
    return err.code;
  }
  assert(false && "expected a parse error");
  return 0;
}

void TestParsesEveryClientMessage() {
  auto auth = ParseClientMessage(R"({"type":"auth","password":"pw"})");
  assert(auth.type == ClientMessageType::kAuth);
  assert(auth.password == "pw");
  assert(!auth.token);

  auto resume = ParseClientMessage(R"({"type":"auth","token":"a.b"})");
  assert(resume.token == "a.b");

  auto raw = ParseClientMessage(R"({"type":"command","command":"nmap -sV 10.0.0.5","cwd":"/srv"})");
  assert(raw.type == ClientMessageType::kCommand);
  assert(raw.command == "nmap -sV 10.0.0.5");
  assert(raw.cwd == "/srv");
  assert(!raw.argv);

  auto split = ParseClientMessage(R"({"type":"command","argv":["nmap","-p","80"]})");
  assert(split.argv.has_value());
  assert((*split.argv == std::vector<std::string>{"nmap", "-p", "80"}));

  auto cancel = ParseClientMessage(R"({"type":"cancel","job_id":"job-1"})");
  assert(cancel.type == ClientMessageType::kCancel);
  assert(cancel.job_id == "job-1");
  assert(!ParseClientMessage(R"({"type":"cancel"})").job_id);

  assert(ParseClientMessage(R"({"type":"status"})").type == ClientMessageType::kStatus);
}

void TestRejectsMalformedMessages() {
  const int malformed = nr::errors::transport::kMalformedMessage;
  assert(ParseErrorCode("") == malformed);
  assert(ParseErrorCode("not json") == malformed);
  assert(ParseErrorCode("[1,2]") == malformed);
  assert(ParseErrorCode(R"({"password":"x"})") == malformed);
  assert(ParseErrorCode(R"({"type":"shell"})") == malformed);
  assert(ParseErrorCode(R"({"type":7})") == malformed);
  assert(ParseErrorCode(R"({"type":"auth"})") == malformed);
  assert(ParseErrorCode(R"({"type":"auth","password":"a","token":"b"})") == malformed);
  assert(ParseErrorCode(R"({"type":"auth","password":5})") == malformed);
  assert(ParseErrorCode(R"({"type":"command"})") == malformed);
  assert(ParseErrorCode(R"({"type":"command","command":"a","argv":["a"]})") == malformed);
  assert(ParseErrorCode(R"({"type":"command","argv":"nmap"})") == malformed);
  assert(ParseErrorCode(R"({"type":"command","argv":["nmap",1]})") == malformed);
  assert(ParseErrorCode(R"({"type":"status","type":"auth"})") == malformed);
  assert(ParseErrorCode(R"({"type":"status"} trailing)") == malformed);

  const std::string huge = R"({"type":"command","command":")" +
                           std::string(nr::transport::kMaxClientMessageBytes, 'a') + "\"}";
  assert(ParseErrorCode(huge) == nr::errors::transport::kMessageTooLarge);
  assert(nr::TransportReasonCode(nr::errors::transport::kMessageTooLarge) == "message_too_large");
}

void TestServerMessages() {
  nr::auth::Identity identity;
  identity.subject = "operator";
  identity.role = "operator";
  identity.expires_at = 1'700'003'600;
  const std::string token = "payload.signature";

  auto ok = Parse(nr::transport::AuthResultMessage(identity, &token));
  assert(ok["type"] == "authResult");
  assert(ok["ok"].asBool());
  assert(ok["token"] == token);
  assert(ok["expires_at"].asInt64() == 1'700'003'600);
  assert(!Parse(nr::transport::AuthResultMessage(identity, nullptr)).isMember("token"));

  auto refused = Parse(nr::transport::AuthFailureMessage("authentication_failed", 42));
  assert(!refused["ok"].asBool());
  assert(refused["reason"] == "authentication_failed");
  assert(refused["retry_after"].asInt64() == 42);
  assert(!Parse(nr::transport::AuthFailureMessage("token_expired", std::nullopt)).isMember("retry_after"));

  nr::exec::OutputEvent output;
  output.job_id = "job-1";
  output.stream = nr::exec::OutputStream::kStderr;
  output.chunk.text = "bad \xFF byte\n";
  output.chunk.redacted_count = 2;
  auto chunk = Parse(nr::transport::OutputChunkMessage(output));
  assert(chunk["type"] == "outputChunk");
  assert(chunk["stream"] == "stderr");
  assert(chunk["data"] == "bad \xEF\xBF\xBD byte\n");
  assert(chunk["redacted"].asUInt64() == 2);

  nr::exec::ExitEvent exit_event;
  exit_event.job_id = "job-1";
  exit_event.state = nr::exec::JobState::kFailed;
  exit_event.signal = 15;
  exit_event.reason = "cancelled";
  auto exit_message = Parse(nr::transport::ExitResultMessage(exit_event));
  assert(exit_message["type"] == "exitResult");
  assert(exit_message["state"] == "failed");
  assert(exit_message["signal"].asInt() == 15);
  assert(!exit_message.isMember("code"));
  assert(exit_message["reason"] == "cancelled");

  nr::exec::JobRecord record;
  record.id = "job-2";
  record.program = "nmap";
  record.state = nr::exec::JobState::kRunning;
  auto status = Parse(nr::transport::StatusMessage("executing", {record}));
  assert(status["state"] == "executing");
  assert(status["jobs"].size() == 1);
  assert(status["jobs"][0]["program"] == "nmap");
  assert(status["jobs"][0]["state"] == "running");
  assert(!status["jobs"][0].isMember("finished_at"));

  auto error = Parse(nr::transport::ErrorMessage("disallowed_program", "Program is not on the allowlist"));
  assert(error["type"] == "error");
  assert(error["reason"] == "disallowed_program");

  auto started = Parse(nr::transport::JobStartedMessage("job-3", "nikto"));
  assert(started["type"] == "jobStarted");
  assert(started["job_id"] == "job-3");
}

void TestUtf8Repair() {
  using nr::transport::ToValidUtf8;
  assert(ToValidUtf8("plain") == "plain");
  assert(ToValidUtf8("caf\xC3\xA9") == "caf\xC3\xA9");
  assert(ToValidUtf8("\xF0\x9F\x94\x92") == "\xF0\x9F\x94\x92");
  assert(ToValidUtf8("\xC3") == "\xEF\xBF\xBD");
  assert(ToValidUtf8("\xC0\xAF") == "\xEF\xBF\xBD\xEF\xBF\xBD");        // overlong
  assert(ToValidUtf8("\xED\xA0\x80") == "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD"); // surrogate
  assert(ToValidUtf8(std::string("a\0b", 3)) == std::string("a\0b", 3));
}

void TestOriginPolicy() {
  using nr::transport::OriginAllowed;
  const std::vector<std::string> none;
  assert(OriginAllowed(none, ""));
  assert(OriginAllowed(none, "http://localhost:5173"));
  assert(OriginAllowed(none, "https://127.0.0.1"));
  assert(OriginAllowed(none, "http://[::1]:8080"));
  assert(OriginAllowed(none, "HTTP://LOCALHOST"));
  assert(!OriginAllowed(none, "https://evil.example"));
  assert(!OriginAllowed(none, "http://localhost.evil.example"));
  assert(!OriginAllowed(none, "null"));

  const std::vector<std::string> listed{"https://console.example.org/"};
  assert(OriginAllowed(listed, "https://console.example.org"));
  assert(OriginAllowed(listed, "HTTPS://Console.Example.Org/"));
  assert(!OriginAllowed(listed, "https://console.example.org.evil"));
  assert(!OriginAllowed(listed, "http://localhost"));
}

void TestBearerExtraction() {
  using nr::transport::ExtractBearerToken;
  assert(ExtractBearerToken("Bearer abc.def") == "abc.def");
  assert(ExtractBearerToken("bearer   abc.def  ") == "abc.def");
  assert(!ExtractBearerToken(""));
  assert(!ExtractBearerToken("Bearer"));
  assert(!ExtractBearerToken("Bearer "));
  assert(!ExtractBearerToken("Basic dXNlcjpwYXNz"));
  assert(!ExtractBearerToken("Bearerabc"));
  assert(!ExtractBearerToken("Bearer a b"));
}

}  // namespace

int main() {
  TestParsesEveryClientMessage();
  TestRejectsMalformedMessages();
  TestServerMessages();
  TestUtf8Repair();
  TestOriginPolicy();
  TestBearerExtraction();
  std::cout << "protocol ok\n";
  return 0;
}
