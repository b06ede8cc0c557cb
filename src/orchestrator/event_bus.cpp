#include "bits3/orchestrator/event_bus.h"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "bits3/common.h"
#include "bits3/crypto/sha256.h"
#include "bits3/error.h"

namespace bits3::orchestrator {

namespace {

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        std::ostringstream hex;
        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
        out += hex.str();
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
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

struct PublishReentrancyGuard {
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  bool& flag_;
};

std::string HashTag(std::string_view value) {
  if (value.empty()) {
    return "hash:";
  }
  auto digest = crypto::SHA256_Hash(AsBytes(value));
  return "hash:" + ToHex(digest);
}

}  // namespace

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

std::optional<EventSeverity> ParseSeverity(std::string_view text) {
  std::string lower;
  lower.reserve(text.size());
  for (char c : text) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  for (auto severity : {EventSeverity::kDebug, EventSeverity::kInfo, EventSeverity::kWarning,
                        EventSeverity::kError, EventSeverity::kCritical}) {
    if (lower == SeverityToString(severity)) {
      return severity;
    }
  }
  return std::nullopt;
}

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
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

std::string BuildEventJson(const Event& event, const std::string& timestamp) {
  std::string payload;
  payload.reserve(256);
  payload += "{\"ts\":\"" + EscapeJson(timestamp) + "\"";
  payload += ",\"severity\":\"";
  payload += SeverityToString(event.severity);
  payload += "\",\"category\":\"";
  payload += CategoryToString(event.category);
  payload += "\"";
  if (!event.event_id.empty()) {
    payload += ",\"event_id\":\"" + EscapeJson(event.event_id) + "\"";
  }
  if (!event.message.empty()) {
    payload += ",\"message\":\"" + EscapeJson(event.message) + "\"";
  }
  for (const auto& field : event.fields) {
    payload += ",\"" + EscapeJson(field.key) + "\":";
    std::string rendered = field.value;
    if (field.privacy == FieldPrivacy::kRedact) {
      rendered = "[REDACTED]";
    } else if (field.privacy == FieldPrivacy::kHash) {
      rendered = HashTag(field.value);
    }
    if (field.numeric && field.privacy == FieldPrivacy::kPublic) {
      payload += rendered;
    } else {
      payload += "\"" + EscapeJson(rendered) + "\"";
    }
  }
  payload += "}";
  return payload;
}

JsonLineLogger::JsonLineLogger(std::ostream& sink, EventSeverity min_severity)
    : sink_(&sink), min_severity_(min_severity) {}

JsonLineLogger::JsonLineLogger(const std::filesystem::path& path, EventSeverity min_severity)
    : sink_(nullptr), min_severity_(min_severity) {
  file_.open(path, std::ios::out | std::ios::app);
  if (!file_) {
    throw MakeError(errors::kConfiguration,
                    "Cannot open log file " + PathToUtf8String(path));
  }
  sink_ = &file_;
}

void JsonLineLogger::Log(const Event& event) {
  if (event.severity < min_severity_.load()) {
    return;
  }
  auto line = BuildEventJson(event, FormatTimestamp(std::chrono::system_clock::now()));
  std::lock_guard<std::mutex> lock(mutex_);
  *sink_ << line << '\n';
  sink_->flush();
}

EventBus& EventBus::Instance() {
  static EventBus instance;
  return instance;
}

std::shared_ptr<const EventBus::SubscriberList> EventBus::Snapshot() const {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  return subscribers_;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    return;  // a subscriber published from inside its callback
  }
  PublishReentrancyGuard guard(in_publish);
  auto targets = Snapshot();
  if (targets) {
    for (const auto& [id, subscriber] : *targets) {
      if (subscriber) {
        subscriber(event);
      }
    }
  }
}

EventBus::SubscriptionId EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto updated = subscribers_ ? std::make_shared<SubscriberList>(*subscribers_)
                              : std::make_shared<SubscriberList>();
  const auto id = next_id_++;
  updated->emplace_back(id, std::move(fn));
  subscribers_ = std::move(updated);
  return id;
}

void EventBus::Unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  if (!subscribers_) {
    return;
  }
  auto updated = std::make_shared<SubscriberList>();
  for (const auto& entry : *subscribers_) {
    if (entry.first != id) {
      updated->push_back(entry);
    }
  }
  subscribers_ = std::move(updated);
}

void EventBus::Clear() {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  subscribers_.reset();
}

void PublishEvent(EventCategory category, EventSeverity severity, std::string event_id,
                  std::string message, std::vector<EventField> fields) {
  Event event;
  event.category = category;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  EventBus::Instance().Publish(event);
}

}  // namespace bits3::orchestrator
