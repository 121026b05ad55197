#pragma once

#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolgate/logging/logger.h"

namespace toolgate {
namespace logging {

// Pattern for glob-style log level control, e.g. "gateway.*"
struct LogPattern {
  std::regex pattern;
  LogLevel level;

  LogPattern(const std::string& glob, LogLevel lvl)
      : pattern(globToRegex(glob)), level(lvl) {}

 private:
  static std::string globToRegex(const std::string& glob) {
    std::string regex;
    for (char c : glob) {
      switch (c) {
        case '*':
          regex += ".*";
          break;
        case '?':
          regex += ".";
          break;
        case '.':
          regex += "\\.";
          break;
        default:
          regex += c;
          break;
      }
    }
    return regex;
  }
};

class LoggerRegistry {
 public:
  // Zero-configuration singleton: stderr sink, Info level
  static LoggerRegistry& instance();

  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);
  std::shared_ptr<Logger> getDefaultLogger();

  // Replaces the sink shared by every logger
  void setDefaultSink(std::shared_ptr<LogSink> sink);
  std::shared_ptr<LogSink> getDefaultSink();

  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  // Applies to loggers named "<Component>.<anything>"
  void setComponentLevel(Component component, LogLevel level);

  void setPattern(const std::string& pattern, LogLevel level);

  bool shouldLog(const std::string& logger_name, LogLevel level);

  LogLevel getEffectiveLevel(const std::string& name);

  std::vector<std::string> getLoggerNames() const;

  // Drops patterns, component levels and named loggers; restores defaults
  void reset();

  static std::string getComponentPath(Component comp, const std::string& name);

 private:
  LoggerRegistry();

  void initializeDefaults();
  LogLevel getEffectiveLevelLocked(const std::string& name) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::unordered_map<Component, LogLevel> component_levels_;
  std::vector<LogPattern> patterns_;

  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<Logger> default_logger_;
  std::shared_ptr<LogSink> default_sink_;
};

// Logger bound to a component, named "<Component>.<name>"
class ComponentLogger {
 public:
  ComponentLogger(Component component, const std::string& name)
      : component_(component), name_(name) {
    logger_ = LoggerRegistry::instance().getOrCreateLogger(
        LoggerRegistry::getComponentPath(component, name));
  }

  template <typename... Args>
  void log(LogLevel level, fmt::format_string<Args...> format_str,
           Args&&... args) {
    if (logger_->shouldLog(level)) {
      logger_->logWithComponent(level, component_, name_, format_str,
                                std::forward<Args>(args)...);
    }
  }

  void setLevel(LogLevel level) { logger_->setLevel(level); }

  const std::shared_ptr<Logger>& logger() const { return logger_; }

 private:
  Component component_;
  std::string name_;
  std::shared_ptr<Logger> logger_;
};

}  // namespace logging
}  // namespace toolgate
