#include "toolgate/logging/logger_registry.h"

#include <algorithm>
#include <cctype>

namespace toolgate {
namespace logging {

namespace {

// "gateway.broadcaster" and "Gateway.x" both select Component::Gateway
bool sameComponentName(const std::string& a, const char* b) {
  std::string rhs(b);
  return a.size() == rhs.size() &&
         std::equal(a.begin(), a.end(), rhs.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

}  // namespace

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry instance;
  return instance;
}

LoggerRegistry::LoggerRegistry() { initializeDefaults(); }

void LoggerRegistry::initializeDefaults() {
  global_level_ = LogLevel::Info;
  default_sink_ = std::make_shared<StdioSink>(StdioSink::Stderr);
  default_logger_ = std::make_shared<Logger>("default");
  default_logger_->setSink(default_sink_);
  default_logger_->setLevel(global_level_);
  loggers_["default"] = default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getDefaultLogger() {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second;
  }

  auto logger = std::make_shared<Logger>(name);
  logger->setLevel(getEffectiveLevelLocked(name));
  logger->setSink(default_sink_);

  loggers_[name] = logger;
  return logger;
}

void LoggerRegistry::setDefaultSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  default_sink_ = std::move(sink);
  for (auto& [name, logger] : loggers_) {
    logger->setSink(default_sink_);
  }
}

std::shared_ptr<LogSink> LoggerRegistry::getDefaultSink() {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_sink_;
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;

  // Loggers pinned by a pattern or component level keep their own level
  for (auto& [name, logger] : loggers_) {
    logger->setLevel(getEffectiveLevelLocked(name));
  }
}

LogLevel LoggerRegistry::getGlobalLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void LoggerRegistry::setComponentLevel(Component component, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  component_levels_[component] = level;

  for (auto& [name, logger] : loggers_) {
    logger->setLevel(getEffectiveLevelLocked(name));
  }
}

void LoggerRegistry::setPattern(const std::string& pattern, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.emplace_back(pattern, level);

  for (auto& [name, logger] : loggers_) {
    if (std::regex_match(name, patterns_.back().pattern)) {
      logger->setLevel(level);
    }
  }
}

bool LoggerRegistry::shouldLog(const std::string& name, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second->shouldLog(level);
  }
  LogLevel effective = getEffectiveLevelLocked(name);
  return effective != LogLevel::Off && level >= effective;
}

LogLevel LoggerRegistry::getEffectiveLevel(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return getEffectiveLevelLocked(name);
}

LogLevel LoggerRegistry::getEffectiveLevelLocked(
    const std::string& name) const {
  // Most recently added pattern wins
  for (auto it = patterns_.rbegin(); it != patterns_.rend(); ++it) {
    if (std::regex_match(name, it->pattern)) {
      return it->level;
    }
  }

  size_t dot_pos = name.find('.');
  if (dot_pos != std::string::npos) {
    std::string comp_str = name.substr(0, dot_pos);
    for (int i = 0; i < static_cast<int>(Component::Count); ++i) {
      Component comp = static_cast<Component>(i);
      if (sameComponentName(comp_str, componentToString(comp))) {
        auto level_it = component_levels_.find(comp);
        if (level_it != component_levels_.end()) {
          return level_it->second;
        }
        break;
      }
    }
  }

  return global_level_;
}

std::vector<std::string> LoggerRegistry::getLoggerNames() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> names;
  names.reserve(loggers_.size());
  for (const auto& [name, logger] : loggers_) {
    names.push_back(name);
  }
  return names;
}

void LoggerRegistry::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  loggers_.clear();
  component_levels_.clear();
  patterns_.clear();
  initializeDefaults();
}

std::string LoggerRegistry::getComponentPath(Component comp,
                                             const std::string& name) {
  return std::string(componentToString(comp)) + "." + name;
}

}  // namespace logging
}  // namespace toolgate
