#pragma once
// TSK019

#include <atomic> // TSK113_Performance_and_Scalability lock-free subscriber snapshot
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory> // TSK029
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "nr/crypto/sha256.h"

namespace nr::orchestrator {

  // TSK019 structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  inline std::string HashForTelemetry(std::string_view input) { // TSK019
    if (input.empty()) {
      return "";
    }
    return nr::crypto::SHA256_Hex(input);
  }

  // One JSON object per line, rotated by size. Directory and size limit come
  // from NETREAPER_LOG_DIR and NETREAPER_LOG_MAX_SIZE.
  class JsonLineLogger { // TSK019
  public:
    JsonLineLogger();
    explicit JsonLineLogger(std::filesystem::path log_path);
    void Log(const Event& event);
    const std::filesystem::path& path() const noexcept { return log_path_; }

  private:
    void EnsureOpen();
    void RotateIfNeeded(size_t incoming_bytes);
    static std::filesystem::path DefaultLogPath();
    size_t ResolveMaxBytes() const;

    std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    size_t max_bytes_;
    const size_t max_files_ = 3;
    uint64_t dropped_streak_{0};
  };

  inline JsonLineLogger& DefaultJsonLogger() { // TSK019
    static JsonLineLogger logger;
    return logger;
  }

  // Serialize an event the way the logger writes it (JsonCpp, one line, field
  // values under "fields"), without the trailing newline. Exposed for the
  // stderr mirror in the daemon and for tests.
  std::string FormatEventLine(const Event& event);

  class EventBus { // TSK019
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);
    // Drops every subscriber, including the default file logger.
    void ClearSubscribers();

    EventBus();

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

} // namespace nr::orchestrator
