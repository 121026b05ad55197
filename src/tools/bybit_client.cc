#define TOOLGATE_LOG_COMPONENT "tools.bybit"

#include "toolgate/tools/bybit_client.h"

#include <fmt/format.h>

#include "toolgate/logging/log_macros.h"

namespace toolgate {
namespace tools {

namespace {

int64_t systemNowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

bool isUnreserved(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
         c == '~';
}

Result<json::JsonValue> toolError(const std::string& message) {
  return makeError<json::JsonValue>(jsonrpc::TOOL_ERROR, message);
}

}  // namespace

std::string percentEncode(const std::string& value) {
  std::string encoded;
  encoded.reserve(value.size());
  for (unsigned char c : value) {
    if (isUnreserved(c)) {
      encoded += static_cast<char>(c);
    } else {
      encoded += fmt::format("%{:02X}", static_cast<unsigned>(c));
    }
  }
  return encoded;
}

std::string buildQueryString(const QueryParams& params) {
  std::string query;
  for (const auto& param : params) {
    if (!query.empty()) {
      query += '&';
    }
    query += percentEncode(param.first);
    query += '=';
    query += percentEncode(param.second);
  }
  return query;
}

BybitClient::BybitClient(std::shared_ptr<RestClient> rest,
                         const Config& config)
    : BybitClient(std::move(rest), config, &systemNowMs) {}

BybitClient::BybitClient(std::shared_ptr<RestClient> rest,
                         const Config& config,
                         TimeSource time_source)
    : rest_(std::move(rest)),
      config_(config),
      time_source_(std::move(time_source)),
      base_url_(config.testnet ? kBybitTestnetUrl : kBybitMainnetUrl),
      signer_(config.api_key, config.api_secret, config.recv_window_ms) {}

Result<json::JsonValue> BybitClient::get(const std::string& path,
                                         const QueryParams& params,
                                         bool authenticated) {
  if (authenticated && !hasCredentials()) {
    return toolError(
        "API credentials are not configured; set BYBIT_API_KEY and "
        "BYBIT_API_SECRET");
  }

  std::string query = buildQueryString(params);

  RestRequest request;
  request.url = base_url_ + path;
  if (!query.empty()) {
    request.url += "?" + query;
  }
  request.timeout = config_.timeout;
  request.headers["Content-Type"] = "application/json";
  if (authenticated) {
    for (auto& header : signer_.sign(time_source_(), query)) {
      request.headers[header.first] = header.second;
    }
  }

  RestResponse response = rest_->get(request);
  if (!response.error.empty()) {
    return toolError(
        fmt::format("Request to {} failed: {}", path, response.error));
  }

  json::JsonValue body;
  bool parsed = true;
  try {
    body = json::JsonValue::parse(response.body);
  } catch (const json::JsonValue::parse_error&) {
    parsed = false;
  }

  if (response.status_code < 200 || response.status_code >= 300) {
    std::string detail;
    if (parsed && body.is_object() && body.contains("retMsg") &&
        body["retMsg"].is_string()) {
      detail = ": " + body["retMsg"].get<std::string>();
    }
    return toolError(fmt::format("HTTP {} from {}{}", response.status_code,
                                 path, detail));
  }
  if (!parsed || !body.is_object()) {
    return toolError(fmt::format("Invalid response from {}", path));
  }

  auto code_it = body.find("retCode");
  if (code_it != body.end() && code_it->is_number_integer() &&
      code_it->get<int64_t>() != 0) {
    std::string message = "unknown error";
    auto msg_it = body.find("retMsg");
    if (msg_it != body.end() && msg_it->is_string()) {
      message = msg_it->get<std::string>();
    }
    TOOLGATE_LOG(Warning, "{} returned retCode {}: {}", path,
                 code_it->get<int64_t>(), message);
    return toolError(fmt::format("Bybit error {}: {}",
                                 code_it->get<int64_t>(), message));
  }

  auto result_it = body.find("result");
  if (result_it == body.end()) {
    return makeSuccess(json::JsonValue::object());
  }
  return makeSuccess(json::JsonValue(*result_it));
}

}  // namespace tools
}  // namespace toolgate
