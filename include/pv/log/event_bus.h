#pragma once

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
#include <vector>

namespace pv::log {

enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

enum class EventCategory { kStorage, kLifecycle, kIntegrity, kDiagnostics };

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

const char* SeverityToString(EventSeverity severity);
const char* CategoryToString(EventCategory category);

// Short SHA-256 fingerprint used for hashed fields such as source paths.
std::string HashForTelemetry(std::string_view input);

// Renders one event as a single-line JSON object.
std::string FormatEventJson(const Event& event, std::chrono::system_clock::time_point when);

// Writes events as JSON lines, either to a file with size based rotation or to a stream.
class JsonLineLogger {
public:
  explicit JsonLineLogger(std::ostream& out);
  JsonLineLogger(std::filesystem::path path, size_t max_bytes, size_t max_files = 3);

  void Log(const Event& event);

private:
  void RotateIfNeeded(size_t incoming_bytes);
  void EnsureOpen();

  std::mutex mutex_;
  std::ostream* sink_{nullptr};
  std::ofstream file_;
  std::optional<std::filesystem::path> path_;
  size_t max_bytes_{0};
  size_t max_files_{3};
};

// Size limit for file logs, from PV_LOG_MAX_BYTES (default 10 MiB).
size_t ResolveLogMaxBytes();

// Synchronous publish/subscribe hub. Components receive a reference to one bus owned by
// the application instead of reaching for a process-wide instance.
class EventBus {
public:
  using Subscriber = std::function<void(const Event&)>;

  EventBus() = default;

  void Publish(const Event& event);
  void Subscribe(Subscriber fn);
  void SetMinimumSeverity(EventSeverity severity);

private:
  std::mutex mutex_;
  std::vector<Subscriber> subscribers_;
  EventSeverity minimum_{EventSeverity::kDebug};
};

// Publishes to |bus| when non-null.
inline void Publish(EventBus* bus, Event event) {
  if (bus != nullptr) {
    bus->Publish(event);
  }
}

} // namespace pv::log
