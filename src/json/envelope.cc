#include "toolgate/json/envelope.h"

namespace toolgate {
namespace json {

namespace {

bool hasSupportedVersion(const JsonValue& value) {
  auto it = value.find("jsonrpc");
  // Clients that omit the version are accepted; a wrong version is not
  if (it == value.end()) {
    return true;
  }
  return it->is_string() && it->get<std::string>() == JSONRPC_VERSION;
}

}  // namespace

JsonValue Envelope::toJson() const {
  JsonValue j = JsonValue::object();
  j["jsonrpc"] = JSONRPC_VERSION;

  switch (kind) {
    case EnvelopeKind::Request:
      j["id"] = id;
      j["method"] = method;
      if (!params.is_null()) {
        j["params"] = params;
      }
      break;
    case EnvelopeKind::Notification:
      j["method"] = method;
      if (!params.is_null()) {
        j["params"] = params;
      }
      break;
    case EnvelopeKind::Success:
      j["id"] = id;
      j["result"] = result;
      break;
    case EnvelopeKind::Error:
      j["id"] = id;
      j["error"] = {{"code", error.code}, {"message", error.message}};
      break;
  }
  return j;
}

std::string Envelope::serialize() const {
  return toJson().dump(-1, ' ', false, JsonValue::error_handler_t::replace);
}

Envelope makeRequest(const JsonValue& id,
                     const std::string& method,
                     const JsonValue& params) {
  Envelope envelope;
  envelope.kind = EnvelopeKind::Request;
  envelope.id = id;
  envelope.method = method;
  envelope.params = params;
  return envelope;
}

Envelope makeNotification(const std::string& method, const JsonValue& params) {
  Envelope envelope;
  envelope.kind = EnvelopeKind::Notification;
  envelope.method = method;
  envelope.params = params;
  return envelope;
}

Envelope makeSuccessResponse(const JsonValue& id, const JsonValue& result) {
  Envelope envelope;
  envelope.kind = EnvelopeKind::Success;
  envelope.id = id;
  envelope.result = result;
  return envelope;
}

Envelope makeErrorResponse(const JsonValue& id, const Error& error) {
  Envelope envelope;
  envelope.kind = EnvelopeKind::Error;
  envelope.id = id;
  envelope.error = error;
  return envelope;
}

Envelope makeErrorResponse(const JsonValue& id,
                           int code,
                           const std::string& message) {
  return makeErrorResponse(id, Error(code, message));
}

bool isValidId(const JsonValue& id) {
  return id.is_null() || id.is_string() || id.is_number();
}

Result<JsonValue> parseJson(const std::string& raw) {
  try {
    return makeSuccess(JsonValue::parse(raw));
  } catch (const JsonValue::parse_error& e) {
    return makeError<JsonValue>(jsonrpc::PARSE_ERROR,
                                std::string("Parse error: ") + e.what());
  }
}

Result<Envelope> parseEnvelope(const JsonValue& value) {
  if (!value.is_object()) {
    return makeError<Envelope>(jsonrpc::INVALID_REQUEST,
                               "Invalid Request: expected a JSON object");
  }
  if (!hasSupportedVersion(value)) {
    return makeError<Envelope>(jsonrpc::INVALID_REQUEST,
                               "Invalid Request: jsonrpc must be \"2.0\"");
  }

  Envelope envelope;
  auto id_it = value.find("id");
  bool has_id = id_it != value.end();
  if (has_id) {
    if (!isValidId(*id_it)) {
      return makeError<Envelope>(
          jsonrpc::INVALID_REQUEST,
          "Invalid Request: id must be a string, number or null");
    }
    envelope.id = *id_it;
  }

  bool has_method = value.contains("method");
  bool has_result = value.contains("result");
  bool has_error = value.contains("error");

  if (has_method) {
    if (has_result || has_error) {
      return makeError<Envelope>(
          jsonrpc::INVALID_REQUEST,
          "Invalid Request: method cannot be combined with result or error");
    }
    const auto& method = value["method"];
    if (!method.is_string()) {
      return makeError<Envelope>(jsonrpc::INVALID_REQUEST,
                                 "Invalid Request: method must be a string");
    }
    envelope.method = method.get<std::string>();
    envelope.kind =
        has_id ? EnvelopeKind::Request : EnvelopeKind::Notification;
    auto params_it = value.find("params");
    if (params_it != value.end()) {
      envelope.params = *params_it;
    }
    return envelope;
  }

  if (has_result == has_error) {
    return makeError<Envelope>(
        jsonrpc::INVALID_REQUEST,
        "Invalid Request: expected method, result or error");
  }

  if (has_result) {
    envelope.kind = EnvelopeKind::Success;
    envelope.result = value["result"];
    return envelope;
  }

  const auto& error = value["error"];
  if (!error.is_object() || !error.contains("code") ||
      !error["code"].is_number_integer()) {
    return makeError<Envelope>(jsonrpc::INVALID_REQUEST,
                               "Invalid Request: malformed error object");
  }
  envelope.kind = EnvelopeKind::Error;
  envelope.error.code = error["code"].get<int>();
  envelope.error.message = error.value("message", std::string());
  return envelope;
}

bool isEnvelope(const JsonValue& value) {
  if (!value.is_object()) {
    return false;
  }
  auto it = value.find("jsonrpc");
  if (it == value.end() || !it->is_string() ||
      it->get<std::string>() != JSONRPC_VERSION) {
    return false;
  }
  return isSuccess(parseEnvelope(value));
}

Envelope wrapAsMessage(const JsonValue& payload, const std::string& level) {
  JsonValue params = JsonValue::object();
  params["message"] =
      payload.is_string()
          ? payload.get<std::string>()
          : payload.dump(-1, ' ', false, JsonValue::error_handler_t::replace);
  params["level"] = level;
  return makeNotification(METHOD_MESSAGE, params);
}

JsonValue extractId(const JsonValue& value) {
  if (value.is_object()) {
    auto it = value.find("id");
    if (it != value.end() && isValidId(*it)) {
      return *it;
    }
  }
  return nullptr;
}

}  // namespace json
}  // namespace toolgate
