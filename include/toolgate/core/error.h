#ifndef TOOLGATE_CORE_ERROR_H
#define TOOLGATE_CORE_ERROR_H

#include <stdexcept>
#include <string>

namespace toolgate {

// JSON-RPC 2.0 error codes
namespace jsonrpc {
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Server-defined range. Raised when a tool's validation or execution fails.
constexpr int TOOL_ERROR = -32000;

inline const char* errorCodeToString(int code) {
  switch (code) {
    case PARSE_ERROR:
      return "Parse error";
    case INVALID_REQUEST:
      return "Invalid Request";
    case METHOD_NOT_FOUND:
      return "Method not found";
    case INVALID_PARAMS:
      return "Invalid params";
    case INTERNAL_ERROR:
      return "Internal error";
    case TOOL_ERROR:
      return "Tool error";
    default:
      return "Unknown error";
  }
}
}  // namespace jsonrpc

/**
 * @brief Protocol-level error carried in error envelopes and Result<T>
 */
struct Error {
  int code{0};
  std::string message;

  Error() = default;
  Error(int c, const std::string& m) : code(c), message(m) {}

  bool operator==(const Error& other) const {
    return code == other.code && message == other.message;
  }
};

/**
 * @brief Raised while wiring the process together, never at request time.
 *
 * Examples: registering two tools under the same name, binding a listener
 * that cannot be created.
 */
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& message)
      : std::runtime_error(message) {}
};

}  // namespace toolgate

#endif  // TOOLGATE_CORE_ERROR_H
