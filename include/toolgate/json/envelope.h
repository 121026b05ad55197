#ifndef TOOLGATE_JSON_ENVELOPE_H
#define TOOLGATE_JSON_ENVELOPE_H

#include <string>

#include <nlohmann/json.hpp>

#include "toolgate/core/error.h"
#include "toolgate/core/result.h"

namespace toolgate {
namespace json {

using JsonValue = nlohmann::json;

constexpr const char* JSONRPC_VERSION = "2.0";

// Server-originated notification methods
constexpr const char* METHOD_CONNECTION_ESTABLISHED = "connection/established";
constexpr const char* METHOD_HEARTBEAT = "heartbeat";
constexpr const char* METHOD_MESSAGE = "notifications/message";

enum class EnvelopeKind { Request, Notification, Success, Error };

/**
 * @brief A JSON-RPC 2.0 message
 *
 * The id is kept as raw JSON so that it is echoed back exactly, including
 * values such as 0, "" or 1.5. A null id means "absent" for requests and
 * "unknown" for error responses.
 */
struct Envelope {
  EnvelopeKind kind{EnvelopeKind::Notification};
  JsonValue id;
  std::string method;
  JsonValue params;
  JsonValue result;
  Error error;

  bool isRequest() const { return kind == EnvelopeKind::Request; }
  bool isNotification() const { return kind == EnvelopeKind::Notification; }
  bool isResponse() const {
    return kind == EnvelopeKind::Success || kind == EnvelopeKind::Error;
  }

  JsonValue toJson() const;

  // Compact single-line text, safe to embed in one SSE data line
  std::string serialize() const;
};

Envelope makeRequest(const JsonValue& id,
                     const std::string& method,
                     const JsonValue& params = JsonValue::object());
Envelope makeNotification(const std::string& method,
                          const JsonValue& params = JsonValue::object());
Envelope makeSuccessResponse(const JsonValue& id, const JsonValue& result);
Envelope makeErrorResponse(const JsonValue& id, const Error& error);
Envelope makeErrorResponse(const JsonValue& id,
                           int code,
                           const std::string& message);

// Valid ids are strings, numbers and null
bool isValidId(const JsonValue& id);

// Parses text. Fails with PARSE_ERROR when the text is not JSON.
Result<JsonValue> parseJson(const std::string& raw);

// Interprets a JSON value as an envelope. Fails with INVALID_REQUEST when
// the value does not have a request, notification or response shape.
Result<Envelope> parseEnvelope(const JsonValue& value);

// True when the value is already a well-formed envelope: an object with
// jsonrpc "2.0" and exactly one of method, result or error.
bool isEnvelope(const JsonValue& value);

// Wraps an arbitrary payload as a notifications/message notification.
// Strings are carried as-is, other values as their compact serialization.
Envelope wrapAsMessage(const JsonValue& payload, const std::string& level);

// Best effort id extraction from a value that failed envelope validation
JsonValue extractId(const JsonValue& value);

}  // namespace json
}  // namespace toolgate

#endif  // TOOLGATE_JSON_ENVELOPE_H
