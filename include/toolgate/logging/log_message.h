#pragma once

#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <unistd.h>

#include "toolgate/logging/log_level.h"

namespace toolgate {
namespace logging {

struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string message;
  std::chrono::system_clock::time_point timestamp;

  Component component{Component::Root};
  std::string component_name;

  // Source location
  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  pid_t process_id{0};
  std::thread::id thread_id;

  // Correlation
  std::string connection_id;
  std::string request_id;
  std::string tool_name;

  std::map<std::string, std::string> key_values;

  std::string logger_name;

  LogMessage()
      : timestamp(std::chrono::system_clock::now()),
        process_id(getpid()),
        thread_id(std::this_thread::get_id()) {}
};

// Correlation context attached to a log call
class LogContext {
 public:
  std::string connection_id;
  std::string request_id;
  std::string tool_name;

  Component component{Component::Root};
  std::string component_name;

  std::map<std::string, std::string> key_values;

  void setLocation(const char* file, int line, const char* func) {
    source_file_ = file;
    source_line_ = line;
    source_function_ = func;
  }

  const char* getFile() const { return source_file_; }
  int getLine() const { return source_line_; }
  const char* getFunction() const { return source_function_; }

  LogMessage toLogMessage(LogLevel level, const std::string& msg) const {
    LogMessage log_msg;
    log_msg.level = level;
    log_msg.message = msg;
    log_msg.component = component;
    log_msg.component_name = component_name;
    log_msg.file = source_file_;
    log_msg.line = source_line_;
    log_msg.function = source_function_;
    log_msg.connection_id = connection_id;
    log_msg.request_id = request_id;
    log_msg.tool_name = tool_name;
    log_msg.key_values = key_values;
    return log_msg;
  }

 private:
  const char* source_file_{nullptr};
  int source_line_{0};
  const char* source_function_{nullptr};
};

}  // namespace logging
}  // namespace toolgate
