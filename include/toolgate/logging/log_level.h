#pragma once

#include <cstdint>
#include <string>

namespace toolgate {
namespace logging {

// Log levels follow RFC-5424 severities
enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Notice = 2,
  Warning = 3,
  Error = 4,
  Critical = 5,
  Alert = 6,
  Emergency = 7,
  Off = 8
};

// Component identifiers for hierarchical logging
enum class Component {
  Root,
  Gateway,
  Dispatcher,
  Transport,
  Http,
  Event,
  Tools,
  Config,
  Count
};

enum class SinkType { File, Stdio, Null, External };

inline const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Notice: return "NOTICE";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
    case LogLevel::Alert: return "ALERT";
    case LogLevel::Emergency: return "EMERGENCY";
    case LogLevel::Off: return "OFF";
    default: return "UNKNOWN";
  }
}

// Unknown names fall back to Info
inline LogLevel stringToLogLevel(const std::string& str) {
  if (str == "DEBUG" || str == "debug") return LogLevel::Debug;
  if (str == "INFO" || str == "info") return LogLevel::Info;
  if (str == "NOTICE" || str == "notice") return LogLevel::Notice;
  if (str == "WARNING" || str == "warning" || str == "warn")
    return LogLevel::Warning;
  if (str == "ERROR" || str == "error") return LogLevel::Error;
  if (str == "CRITICAL" || str == "critical") return LogLevel::Critical;
  if (str == "ALERT" || str == "alert") return LogLevel::Alert;
  if (str == "EMERGENCY" || str == "emergency") return LogLevel::Emergency;
  if (str == "OFF" || str == "off") return LogLevel::Off;
  return LogLevel::Info;
}

inline bool isKnownLogLevel(const std::string& str) {
  return stringToLogLevel(str) != LogLevel::Info || str == "INFO" ||
         str == "info";
}

inline const char* componentToString(Component component) {
  switch (component) {
    case Component::Root: return "Root";
    case Component::Gateway: return "Gateway";
    case Component::Dispatcher: return "Dispatcher";
    case Component::Transport: return "Transport";
    case Component::Http: return "Http";
    case Component::Event: return "Event";
    case Component::Tools: return "Tools";
    case Component::Config: return "Config";
    default: return "Unknown";
  }
}

}  // namespace logging
}  // namespace toolgate
