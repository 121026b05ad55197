#include "toolgate/http/http_message.h"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

namespace toolgate {
namespace http {

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return value;
}

void appendHead(fmt::memory_buffer& out,
                int status_code,
                const std::vector<std::pair<std::string, std::string>>& headers) {
  auto it = std::back_inserter(out);
  fmt::format_to(it, "HTTP/1.1 {} {}\r\n", status_code, statusText(status_code));
  for (const auto& header : headers) {
    fmt::format_to(it, "{}: {}\r\n", header.first, header.second);
  }
}

}  // namespace

const char* httpMethodToString(HttpMethod method) {
  switch (method) {
    case HttpMethod::GET:
      return "GET";
    case HttpMethod::POST:
      return "POST";
    case HttpMethod::PUT:
      return "PUT";
    case HttpMethod::DELETE:
      return "DELETE";
    case HttpMethod::HEAD:
      return "HEAD";
    case HttpMethod::OPTIONS:
      return "OPTIONS";
    case HttpMethod::PATCH:
      return "PATCH";
    default:
      return "UNKNOWN";
  }
}

std::string HttpRequest::header(const std::string& name) const {
  auto it = headers.find(toLower(name));
  return it == headers.end() ? std::string() : it->second;
}

std::string HttpResponse::serialize() const {
  fmt::memory_buffer out;
  appendHead(out, status_code, headers);
  fmt::format_to(std::back_inserter(out), "Content-Length: {}\r\n\r\n",
                 body.size());
  out.append(body.data(), body.data() + body.size());
  return fmt::to_string(out);
}

std::string serializeStreamHead(
    int status_code,
    const std::vector<std::pair<std::string, std::string>>& headers) {
  fmt::memory_buffer out;
  appendHead(out, status_code, headers);
  fmt::format_to(std::back_inserter(out), "\r\n");
  return fmt::to_string(out);
}

const char* statusText(int status_code) {
  switch (status_code) {
    case 200:
      return "OK";
    case 204:
      return "No Content";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 413:
      return "Payload Too Large";
    case 500:
      return "Internal Server Error";
    case 501:
      return "Not Implemented";
    case 503:
      return "Service Unavailable";
    default:
      return "Unknown";
  }
}

}  // namespace http
}  // namespace toolgate
