#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bits3::orchestrator {

  // structured logging primitives
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

  inline EventField NumericField(std::string key, uint64_t value) {
    return EventField(std::move(key), std::to_string(value), FieldPrivacy::kPublic, true);
  }

  const char* SeverityToString(EventSeverity severity);
  // Accepts DEBUG, INFO, WARNING, ERROR, CRITICAL in any case.
  std::optional<EventSeverity> ParseSeverity(std::string_view text);

  // One JSON object, no trailing newline. kRedact fields render as
  // "[REDACTED]" and kHash fields as "hash:<sha256 hex>".
  std::string BuildEventJson(const Event& event, const std::string& timestamp);

  std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

  class JsonLineLogger {
  public:
    // Writes to |sink|, which must outlive the logger.
    explicit JsonLineLogger(std::ostream& sink, EventSeverity min_severity = EventSeverity::kInfo);
    // Appends to |path|; throws bits3::Error (kConfiguration) if it cannot be opened.
    explicit JsonLineLogger(const std::filesystem::path& path,
                            EventSeverity min_severity = EventSeverity::kInfo);

    void Log(const Event& event);
    void SetMinSeverity(EventSeverity severity) noexcept { min_severity_.store(severity); }

  private:
    std::mutex mutex_;
    std::ofstream file_;
    std::ostream* sink_;
    std::atomic<EventSeverity> min_severity_;
  };

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;
    using SubscriptionId = uint64_t;

    static EventBus& Instance();

    void Publish(const Event& event);
    SubscriptionId Subscribe(Subscriber fn);
    void Unsubscribe(SubscriptionId id);
    // Drops every subscriber; tests call this between cases.
    void Clear();

  private:
    using SubscriberList = std::vector<std::pair<SubscriptionId, Subscriber>>;

    std::shared_ptr<const SubscriberList> Snapshot() const;

    mutable std::mutex subscribers_mutex_;
    std::shared_ptr<const SubscriberList> subscribers_;
    SubscriptionId next_id_{1};
  };

  // Convenience wrapper around EventBus::Instance().Publish.
  void PublishEvent(EventCategory category, EventSeverity severity, std::string event_id,
                    std::string message, std::vector<EventField> fields = {});

} // namespace bits3::orchestrator
