#ifndef TOOLGATE_HTTP_HTTP_REQUEST_PARSER_H
#define TOOLGATE_HTTP_HTTP_REQUEST_PARSER_H

#include <cstddef>
#include <memory>
#include <string>

#include "toolgate/http/http_message.h"

// Forward declare llhttp types to avoid including llhttp.h in header
typedef struct llhttp__internal_s llhttp_t;
typedef struct llhttp_settings_s llhttp_settings_t;

namespace toolgate {
namespace http {

/**
 * Incremental HTTP/1.x request parser backed by llhttp.
 *
 * Feed bytes as they arrive; once a full request has been read the parser
 * pauses and reports Complete. Not thread-safe, create one per connection.
 */
class HttpRequestParser {
 public:
  enum class Status {
    NeedMore,   // Request incomplete, feed more bytes
    Complete,   // request() holds a full request
    Error,      // Malformed input, see error()
    TooLarge    // Body exceeded the configured limit
  };

  explicit HttpRequestParser(size_t max_body_bytes = 1024 * 1024);
  ~HttpRequestParser();

  HttpRequestParser(const HttpRequestParser&) = delete;
  HttpRequestParser& operator=(const HttpRequestParser&) = delete;

  // Consumes as much of data as belongs to the current request
  Status execute(const char* data, size_t length);

  const HttpRequest& request() const { return request_; }
  const std::string& error() const { return error_; }
  Status status() const { return status_; }
  // Bytes of the last execute() call that were used
  size_t consumed() const { return consumed_; }

  // Prepares the parser for the next request on the same connection
  void reset();

 private:
  static int onMessageBegin(llhttp_t* parser);
  static int onUrl(llhttp_t* parser, const char* data, size_t length);
  static int onHeaderField(llhttp_t* parser, const char* data, size_t length);
  static int onHeaderValue(llhttp_t* parser, const char* data, size_t length);
  static int onHeadersComplete(llhttp_t* parser);
  static int onBody(llhttp_t* parser, const char* data, size_t length);
  static int onMessageComplete(llhttp_t* parser);

  void commitHeader();

  std::unique_ptr<llhttp_t> parser_;
  std::unique_ptr<llhttp_settings_t> settings_;
  size_t max_body_bytes_;

  HttpRequest request_;
  std::string current_field_;
  std::string current_value_;
  bool reading_value_{false};

  Status status_{Status::NeedMore};
  std::string error_;
  size_t consumed_{0};
};

}  // namespace http
}  // namespace toolgate

#endif  // TOOLGATE_HTTP_HTTP_REQUEST_PARSER_H
