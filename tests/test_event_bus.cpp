#include "nr/orchestrator/event_bus.h" // TSK019

#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using nr::orchestrator::Event;
using nr::orchestrator::EventBus;
using nr::orchestrator::EventCategory;
using nr::orchestrator::EventSeverity;
using nr::orchestrator::FieldPrivacy;
using nr::orchestrator::FormatEventLine;
using nr::orchestrator::JsonLineLogger;

void TestFieldPrivacy() {
  Event event;
  event.category = EventCategory::kSecurity;
  event.severity = EventSeverity::kWarning;
  event.event_id = "auth_failed";
  event.message = "Authentication rejected";
  event.fields.emplace_back("client", "203.0.113.7", FieldPrivacy::kHash);
  event.fields.emplace_back("reason", "authentication_failed");
  event.fields.emplace_back("password", "hunter2");              // inferred from the key
  event.fields.emplace_back("command", "nmap -sV 10.0.0.5");     // inferred from the key
  event.fields.emplace_back("note", "visible", FieldPrivacy::kRedact);
  event.fields.emplace_back("retry_after", "42", FieldPrivacy::kPublic, true);

  const auto line = FormatEventLine(event);
  assert(line.find("\"event_id\":\"auth_failed\"") != std::string::npos);
  assert(line.find("\"severity\":\"warning\"") != std::string::npos);
  assert(line.find("\"category\":\"security\"") != std::string::npos);
  assert(line.find("\"reason\":\"authentication_failed\"") != std::string::npos);
  assert(line.find("\"retry_after\":42") != std::string::npos);
  assert(line.find("\"note\":\"[REDACTED]\"") != std::string::npos);
  assert(line.find("203.0.113.7") == std::string::npos);
  assert(line.find("hunter2") == std::string::npos);
  assert(line.find("10.0.0.5") == std::string::npos);
  assert(line.find("\"client\":\"hash:" + nr::orchestrator::HashForTelemetry("203.0.113.7") + "\"") !=
         std::string::npos);
}

void TestEscapingAndPathMessages() {
  Event event;
  event.event_id = "x";
  event.message = "/etc/netreaper/gateway.json";
  event.fields.emplace_back("detail", "line\n\"quoted\"\x01");
  const auto line = FormatEventLine(event);
  assert(line.find("/etc/netreaper") == std::string::npos);
  assert(line.find("\\n\\\"quoted\\\"\\u0001") != std::string::npos);
}

void TestOversizedEventIsReplaced() {
  Event event;
  event.event_id = "huge";
  event.fields.emplace_back("blob", std::string(64 * 1024, 'x'));
  const auto line = FormatEventLine(event);
  assert(line.find("event_too_large") != std::string::npos);
  assert(line.size() < 1024);
}

void TestSubscribersAndFileLogger() {
  const auto dir = fs::temp_directory_path() / ("nrgate_events_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  auto logger = std::make_shared<JsonLineLogger>(dir / "gateway.log");

  auto& bus = EventBus::Instance();
  bus.ClearSubscribers();
  std::vector<std::string> seen;
  bus.Subscribe([&seen](const Event& event) { seen.push_back(event.event_id); });
  bus.Subscribe([logger](const Event& event) { logger->Log(event); });
  // A subscriber that publishes again is not re-entered.
  bus.Subscribe([&bus](const Event& event) {
    if (event.event_id == "session_opened") {
      Event nested;
      nested.event_id = "nested";
      bus.Publish(nested);
    }
  });

  Event opened;
  opened.category = EventCategory::kLifecycle;
  opened.event_id = "session_opened";
  bus.Publish(opened);
  Event closed = opened;
  closed.event_id = "session_closed";
  bus.Publish(closed);

  assert((seen == std::vector<std::string>{"session_opened", "session_closed"}));

  std::ifstream in(logger->path());
  std::string first;
  std::string second;
  std::getline(in, first);
  std::getline(in, second);
  assert(first.find("\"event_id\":\"session_opened\"") != std::string::npos);
  assert(second.find("\"event_id\":\"session_closed\"") != std::string::npos);
  assert(first.front() == '{' && first.back() == '}');
  assert(first.find("\"ts\":\"") != std::string::npos);

  bus.ClearSubscribers();
  bus.Publish(opened);
  assert(seen.size() == 2);
  fs::remove_all(dir);
}

}  // namespace

int main() {
  TestFieldPrivacy();
  TestEscapingAndPathMessages();
  TestOversizedEventIsReplaced();
  TestSubscribersAndFileLogger();
  std::cout << "event bus ok\n";
  return 0;
}
