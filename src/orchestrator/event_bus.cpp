#include "nr/orchestrator/event_bus.h"

#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <system_error>

namespace nr::orchestrator {
namespace {

constexpr size_t kMaxEventBytes = 16 * 1024; // TSK069_DoS_Resource_Exhaustion_Guards cap serialized size
constexpr size_t kDefaultMaxLogBytes = 10 * 1024 * 1024;
constexpr std::string_view kRedacted{"[REDACTED]"};

std::string HashTag(std::string_view value) { // TSK139_Memory_Disclosure_And_Information_Leaks
  return std::string{"hash:"} + HashForTelemetry(value);
}

// Config and script paths reveal the operator's layout; messages that carry
// one are logged as a digest.
bool LooksLikeFilesystemPath(std::string_view value) {
  return value.find('/') != std::string_view::npos || value.find('\\') != std::string_view::npos;
}

bool FieldKeyImpliesSensitive(std::string_view key) { // TSK139_Memory_Disclosure_And_Information_Leaks
  static constexpr std::string_view kMarkers[] = {"secret", "password", "token",
                                                  "credential", "command", "cwd"};
  std::string lowered(key);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::any_of(std::begin(kMarkers), std::end(kMarkers), [&lowered](std::string_view marker) {
    return lowered.find(marker) != std::string::npos;
  });
}

std::string FieldText(const EventField& field) {
  switch (field.privacy) {
  case FieldPrivacy::kRedact:
    return std::string(kRedacted);
  case FieldPrivacy::kHash:
    return HashTag(field.value);
  case FieldPrivacy::kPublic:
    break;
  }
  if (FieldKeyImpliesSensitive(field.key)) {
    return HashTag(field.value);
  }
  return field.value;
}

Json::Value FieldValue(const EventField& field) {
  if (field.numeric && field.privacy == FieldPrivacy::kPublic && !FieldKeyImpliesSensitive(field.key)) {
    long long number = 0;
    const char* begin = field.value.data();
    const char* end = begin + field.value.size();
    auto [ptr, ec] = std::from_chars(begin, end, number);
    if (ec == std::errc() && ptr == end) {
      return Json::Value(static_cast<Json::Int64>(number));
    }
  }
  return Json::Value(FieldText(field));
}

Event BuildOversizeEvent(const Event& original) { // TSK069_DoS_Resource_Exhaustion_Guards redacted fallback
  Event replacement;
  replacement.category = EventCategory::kDiagnostics;
  replacement.severity = EventSeverity::kWarning;
  replacement.event_id = "event_too_large";
  replacement.message = "Event payload exceeded logger limits";
  if (!original.event_id.empty()) {
    replacement.fields.emplace_back("original_event_id", original.event_id, FieldPrivacy::kHash);
  }
  replacement.fields.emplace_back("limit_bytes", std::to_string(kMaxEventBytes), FieldPrivacy::kPublic, true);
  return replacement;
}

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

std::string SerializeEvent(const Event& event, const std::string& timestamp) {
  Json::Value root(Json::objectValue);
  root["ts"] = timestamp;
  root["severity"] = SeverityToString(event.severity);
  root["category"] = CategoryToString(event.category);
  if (!event.event_id.empty()) {
    root["event_id"] = event.event_id;
  }
  if (!event.message.empty()) {
    root["message"] = LooksLikeFilesystemPath(event.message) ? HashTag(event.message) : event.message;
  }
  if (!event.fields.empty()) {
    Json::Value fields(Json::objectValue);
    for (const auto& field : event.fields) {
      fields[field.key] = FieldValue(field);
    }
    root["fields"] = std::move(fields);
  }
  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  writer["emitUTF8"] = true;
  return Json::writeString(writer, root);
}

// Oversized events are replaced by a fixed-size notice rather than truncated.
std::string BoundedEventLine(const Event& event, const std::string& timestamp) {
  auto line = SerializeEvent(event, timestamp);
  if (line.size() > kMaxEventBytes) {
    line = SerializeEvent(BuildOversizeEvent(event), timestamp);
  }
  return line;
}

std::string FormatUtcTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

void ReportLoggerError(std::string_view what, const std::error_code& ec) { // TSK109_Error_Code_Handling
  std::clog << "{\"event\":\"logger_error\",\"message\":\"" << what << "\",\"error_code\":" << ec.value()
            << "}" << std::endl;
}

} // namespace

std::string FormatEventLine(const Event& event) {
  return BoundedEventLine(event, FormatUtcTimestamp(std::chrono::system_clock::now()));
}

JsonLineLogger::JsonLineLogger() : JsonLineLogger(DefaultLogPath()) {}

JsonLineLogger::JsonLineLogger(std::filesystem::path log_path)
    : log_path_(std::move(log_path)), max_bytes_(ResolveMaxBytes()) {}

std::filesystem::path JsonLineLogger::DefaultLogPath() {
  std::filesystem::path logs_dir = std::filesystem::path("logs");
  const char* env = std::getenv("NETREAPER_LOG_DIR");
  if (env && *env != '\0') {
    logs_dir = std::filesystem::path(env);
  }
  // Directory creation is deferred to EnsureOpen so a bad directory degrades
  // to stderr-only logging instead of failing static initialization.
  return logs_dir / "gateway.log";
}

size_t JsonLineLogger::ResolveMaxBytes() const {
  const char* env = std::getenv("NETREAPER_LOG_MAX_SIZE");
  if (!env || *env == '\0') {
    return kDefaultMaxLogBytes;
  }
  const char* end = env + std::strlen(env);
  unsigned long long value = 0;
  auto [ptr, ec] = std::from_chars(env, end, value);
  if (ec != std::errc() || ptr != end || value == 0) {
    return kDefaultMaxLogBytes;
  }
  return static_cast<size_t>(std::min<unsigned long long>(value, std::numeric_limits<size_t>::max()));
}

void JsonLineLogger::EnsureOpen() {
  if (stream_.is_open()) {
    return;
  }
  const auto parent = log_path_.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      ReportLoggerError("log directory create failed", ec);
      return;
    }
  }
  stream_.open(log_path_, std::ios::out | std::ios::app);
}

// gateway.log -> gateway.log.1 -> ... -> gateway.log.<max_files_>, oldest dropped.
void JsonLineLogger::RotateIfNeeded(size_t incoming_bytes) {
  std::error_code ec;
  auto current_size = std::filesystem::file_size(log_path_, ec);
  if (ec) {
    current_size = 0; // not written yet
  }
  if (current_size + incoming_bytes <= max_bytes_) {
    return;
  }
  if (stream_.is_open()) {
    stream_.close();
  }
  const auto numbered = [this](size_t idx) {
    return std::filesystem::path(log_path_.string() + "." + std::to_string(idx));
  };
  for (size_t idx = max_files_; idx > 0; --idx) {
    const auto src = idx == 1 ? log_path_ : numbered(idx - 1);
    std::error_code rotate_ec;
    if (!std::filesystem::exists(src, rotate_ec)) {
      continue;
    }
    std::filesystem::rename(src, numbered(idx), rotate_ec);
    if (rotate_ec) {
      ReportLoggerError("log rotate rename failed", rotate_ec);
    }
  }
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  const auto line = BoundedEventLine(event, FormatUtcTimestamp(std::chrono::system_clock::now()));

  RotateIfNeeded(line.size() + 1);
  EnsureOpen();
  if (!stream_.is_open()) {
    if (++dropped_streak_ == 1) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open log file\"}" << std::endl;
    }
    return;
  }
  stream_ << line << '\n';
  stream_.flush();
  dropped_streak_ = 0;
}

EventBus::EventBus() {
  auto initial = std::make_shared<SubscriberList>();
  initial->push_back([](const Event& e) { DefaultJsonLogger().Log(e); });
  subscribers_snapshot_ = std::move(initial);
}

EventBus& EventBus::Instance() {
  static EventBus bus;
  return bus;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false; // TSK104_Concurrency_Deadlock_and_Lock_Ordering detect recursion
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  in_publish = true;
  struct Reset {
    bool& flag;
    ~Reset() { flag = false; }
  } reset{in_publish};

  // Subscribers run outside the lock against the snapshot taken here.
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (!targets) {
    return;
  }
  for (const auto& subscriber : *targets) {
    if (subscriber) {
      subscriber(event);
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated = current ? std::make_shared<SubscriberList>(*current) : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_, std::shared_ptr<const SubscriberList>(std::move(updated)),
                             std::memory_order_release);
}

void EventBus::ClearSubscribers() {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  std::atomic_store_explicit(&subscribers_snapshot_,
                             std::shared_ptr<const SubscriberList>(std::make_shared<SubscriberList>()),
                             std::memory_order_release);
}

} // namespace nr::orchestrator
