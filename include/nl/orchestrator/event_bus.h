#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <memory>
#include <mutex>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "nl/crypto/sha256.h"

namespace nl::orchestrator {

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

  // Hex SHA-256 of |input|. Used for identifiers that must be correlatable in
  // logs without being disclosed.
  inline std::string HashForTelemetry(std::string_view input) {
    if (input.empty()) {
      return "";
    }
    nl::crypto::SHA256_Stream hasher;
    hasher.Update(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(input.data()),
                                           input.size()));
    const auto digest = hasher.Finalize();
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : digest) {
      oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
  }

  const char* SeverityToString(EventSeverity severity);
  const char* CategoryToString(EventCategory category);

  // Serialises |event| as a single JSON object, applying field privacy.
  std::string FormatEventJson(const Event& event, std::string_view timestamp);

  // Writes one JSON object per line to NL_EVENT_LOG, or std::clog when unset.
  // Events below NL_LOG_LEVEL (default info) are dropped.
  class JsonLineLogger {
  public:
    JsonLineLogger();
    void Log(const Event& event);
    EventSeverity MinimumSeverity() const noexcept { return min_severity_; }

  private:
    std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
    void EnsureOpen();

    std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    EventSeverity min_severity_{EventSeverity::kInfo};
    bool open_failed_{false};
  };

  JsonLineLogger& DefaultJsonLogger();

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

    EventBus();

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  // Drops every added subscriber and restores the default logger.
  void ResetEventBusForTesting();

} // namespace nl::orchestrator
