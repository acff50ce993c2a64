#include "pv/log/event_bus.h"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

#include "pv/common.h"
#include "pv/crypto/digest.h"

namespace pv::log {

namespace {

constexpr size_t kDefaultMaxLogBytes = 10 * 1024 * 1024;
constexpr size_t kTelemetryHashChars = 16;

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
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
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
    }
  }
  return out;
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

} // namespace

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
  case EventCategory::kStorage:
    return "storage";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kIntegrity:
    return "integrity";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  auto hex = crypto::HashBytesHex(crypto::HashAlgorithm::SHA256, AsBytes(input));
  return hex.substr(0, kTelemetryHashChars);
}

std::string FormatEventJson(const Event& event, std::chrono::system_clock::time_point when) {
  std::string payload = "{\"timestamp\":\"";
  payload += FormatTimestamp(when);
  payload += "\",\"severity\":\"";
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
    switch (field.privacy) {
    case FieldPrivacy::kRedact:
      payload += "\"[redacted]\"";
      continue;
    case FieldPrivacy::kHash:
      payload += "\"" + HashForTelemetry(field.value) + "\"";
      continue;
    case FieldPrivacy::kPublic:
      break;
    }
    if (field.numeric) {
      payload += field.value;
    } else {
      payload += "\"" + EscapeJson(field.value) + "\"";
    }
  }
  payload += "}";
  return payload;
}

size_t ResolveLogMaxBytes() {
  const char* env = std::getenv("PV_LOG_MAX_BYTES");
  if (!env || *env == '\0') {
    return kDefaultMaxLogBytes;
  }
  unsigned long long value = 0;
  auto [ptr, ec] = std::from_chars(env, env + std::strlen(env), value);
  if (ec != std::errc() || ptr != env + std::strlen(env) || value == 0) {
    return kDefaultMaxLogBytes;
  }
  return static_cast<size_t>(
      std::min<unsigned long long>(value, std::numeric_limits<size_t>::max()));
}

JsonLineLogger::JsonLineLogger(std::ostream& out) : sink_(&out) {}

JsonLineLogger::JsonLineLogger(std::filesystem::path path, size_t max_bytes, size_t max_files)
    : path_(std::move(path)), max_bytes_(max_bytes), max_files_(max_files) {}

void JsonLineLogger::EnsureOpen() {
  if (!path_ || file_.is_open()) {
    return;
  }
  std::error_code ec;
  auto parent = path_->parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
  }
  file_.open(*path_, std::ios::app);
  if (!file_) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"log file open failed\"}" << std::endl;
  }
}

void JsonLineLogger::RotateIfNeeded(size_t incoming_bytes) {
  if (!path_) {
    return;
  }
  std::error_code ec;
  auto current_size = std::filesystem::file_size(*path_, ec);
  if (ec) {
    current_size = 0;
  }
  if (current_size + incoming_bytes <= max_bytes_) {
    return;
  }
  if (file_.is_open()) {
    file_.close();
  }
  for (size_t idx = max_files_; idx > 0; --idx) {
    auto from = idx == 1 ? *path_ : std::filesystem::path(path_->string() + "." +
                                                           std::to_string(idx - 1));
    auto to = std::filesystem::path(path_->string() + "." + std::to_string(idx));
    if (std::filesystem::exists(from, ec)) {
      std::filesystem::rename(from, to, ec);
      if (ec) {
        std::clog << "{\"event\":\"logger_error\",\"message\":\"log rotation failed\",\"error_code\":"
                  << ec.value() << "}" << std::endl;
        ec.clear();
      }
    }
  }
}

void JsonLineLogger::Log(const Event& event) {
  std::string line = FormatEventJson(event, std::chrono::system_clock::now());
  std::lock_guard<std::mutex> guard(mutex_);
  if (sink_ != nullptr) {
    *sink_ << line << '\n';
    sink_->flush();
    return;
  }
  RotateIfNeeded(line.size() + 1);
  EnsureOpen();
  if (file_) {
    file_ << line << '\n';
    file_.flush();
  }
}

void EventBus::Publish(const Event& event) {
  std::vector<Subscriber> snapshot;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (static_cast<int>(event.severity) < static_cast<int>(minimum_)) {
      return;
    }
    snapshot = subscribers_;
  }
  for (const auto& subscriber : snapshot) {
    subscriber(event);
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(mutex_);
  subscribers_.push_back(std::move(fn));
}

void EventBus::SetMinimumSeverity(EventSeverity severity) {
  std::lock_guard<std::mutex> guard(mutex_);
  minimum_ = severity;
}

} // namespace pv::log
