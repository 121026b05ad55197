#ifndef TOOLGATE_HTTP_HTTP_MESSAGE_H
#define TOOLGATE_HTTP_HTTP_MESSAGE_H

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace toolgate {
namespace http {

enum class HttpMethod { GET, POST, PUT, DELETE, HEAD, OPTIONS, PATCH, UNKNOWN };

const char* httpMethodToString(HttpMethod method);

/**
 * Parsed inbound request. Header names are stored lowercased.
 */
struct HttpRequest {
  HttpMethod method{HttpMethod::UNKNOWN};
  std::string url;
  std::string path;
  std::string query;
  std::map<std::string, std::string> headers;
  std::string body;
  bool keep_alive{false};

  // Case-insensitive lookup; empty when absent
  std::string header(const std::string& name) const;
};

/**
 * Outbound response with an explicit Content-Length
 */
struct HttpResponse {
  int status_code{200};
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;

  HttpResponse() = default;
  HttpResponse(int status, std::string body_text)
      : status_code(status), body(std::move(body_text)) {}

  HttpResponse& addHeader(const std::string& name, const std::string& value) {
    headers.emplace_back(name, value);
    return *this;
  }

  std::string serialize() const;
};

const char* statusText(int status_code);

// Response head for a text/event-stream; the body follows as SSE frames
std::string serializeStreamHead(
    int status_code,
    const std::vector<std::pair<std::string, std::string>>& headers);

}  // namespace http
}  // namespace toolgate

#endif  // TOOLGATE_HTTP_HTTP_MESSAGE_H
