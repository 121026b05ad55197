#include "toolgate/logging/log_formatter.h"

#include <ctime>
#include <sstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace toolgate {
namespace logging {

namespace {

std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;

  std::tm tm_buf;
  localtime_r(&time_t, &tm_buf);

  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return fmt::format("{}.{:03d}", date, static_cast<int>(ms.count()));
}

std::string threadIdToString(std::thread::id id) {
  std::ostringstream oss;
  oss << id;
  return oss.str();
}

}  // namespace

std::string DefaultFormatter::format(const LogMessage& msg) const {
  fmt::memory_buffer out;
  auto it = std::back_inserter(out);

  fmt::format_to(it, "[{}] [{}] [T:{}] ", formatTimestamp(msg.timestamp),
                 logLevelToString(msg.level), threadIdToString(msg.thread_id));

  if (msg.component != Component::Root) {
    fmt::format_to(it, "[{}", componentToString(msg.component));
    if (!msg.component_name.empty()) {
      fmt::format_to(it, ".{}", msg.component_name);
    }
    fmt::format_to(it, "] ");
  }

  fmt::format_to(it, "[{}] ", msg.logger_name);

  if (msg.file && msg.line > 0) {
    fmt::format_to(it, "[{}:{}", msg.file, msg.line);
    if (msg.function) {
      fmt::format_to(it, " {}()", msg.function);
    }
    fmt::format_to(it, "] ");
  }

  if (!msg.connection_id.empty()) {
    fmt::format_to(it, "[conn:{}] ", msg.connection_id);
  }
  if (!msg.request_id.empty()) {
    fmt::format_to(it, "[req:{}] ", msg.request_id);
  }
  if (!msg.tool_name.empty()) {
    fmt::format_to(it, "[tool:{}] ", msg.tool_name);
  }

  fmt::format_to(it, "{}", msg.message);

  if (!msg.key_values.empty()) {
    fmt::format_to(it, " {{");
    bool first = true;
    for (const auto& kv : msg.key_values) {
      fmt::format_to(it, "{}{}={}", first ? "" : ", ", kv.first, kv.second);
      first = false;
    }
    fmt::format_to(it, "}}");
  }

  return fmt::to_string(out);
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  nlohmann::json j;
  j["timestamp"] = formatTimestamp(msg.timestamp);
  j["level"] = logLevelToString(msg.level);
  j["logger"] = msg.logger_name;
  j["thread"] = threadIdToString(msg.thread_id);
  if (msg.process_id > 0) {
    j["pid"] = msg.process_id;
  }

  if (msg.component != Component::Root) {
    j["component"] = componentToString(msg.component);
    if (!msg.component_name.empty()) {
      j["component_name"] = msg.component_name;
    }
  }

  if (msg.file) {
    j["file"] = msg.file;
    j["line"] = msg.line;
    if (msg.function) {
      j["function"] = msg.function;
    }
  }

  if (!msg.connection_id.empty()) {
    j["connection_id"] = msg.connection_id;
  }
  if (!msg.request_id.empty()) {
    j["request_id"] = msg.request_id;
  }
  if (!msg.tool_name.empty()) {
    j["tool"] = msg.tool_name;
  }

  j["message"] = msg.message;

  if (!msg.key_values.empty()) {
    j["metadata"] = msg.key_values;
  }

  // Invalid UTF-8 in a message must not take the process down
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::unique_ptr<Formatter> createFormatter(const std::string& name) {
  if (name == "text" || name == "default") {
    return std::make_unique<DefaultFormatter>();
  }
  if (name == "json") {
    return std::make_unique<JsonFormatter>();
  }
  return nullptr;
}

}  // namespace logging
}  // namespace toolgate
