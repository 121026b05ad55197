/**
 * @file parse_error.h
 * @brief Error raised when a configuration file cannot be used
 */

#pragma once

#include <sstream>
#include <stdexcept>
#include <string>

namespace toolgate {
namespace config {

/**
 * @brief Configuration parse error with field and file context
 */
class ConfigParseError : public std::runtime_error {
 public:
  ConfigParseError(const std::string& message,
                   const std::string& field = "",
                   const std::string& file = "",
                   int line = -1)
      : std::runtime_error(formatError(message, field, file, line)),
        message_(message),
        field_(field),
        file_(file),
        line_(line) {}

  const std::string& field() const { return field_; }
  const std::string& file() const { return file_; }
  int line() const { return line_; }
  const std::string& message() const { return message_; }

 private:
  static std::string formatError(const std::string& msg,
                                 const std::string& field,
                                 const std::string& file,
                                 int line) {
    std::ostringstream oss;
    oss << "Configuration parse error";

    if (!file.empty()) {
      oss << " in " << file;
      if (line > 0) {
        oss << ":" << line;
      }
    }

    if (!field.empty()) {
      oss << " at field '" << field << "'";
    }

    oss << ": " << msg;
    return oss.str();
  }

  std::string message_;
  std::string field_;
  std::string file_;
  int line_;
};

}  // namespace config
}  // namespace toolgate
