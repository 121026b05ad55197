#include "toolgate/http/http_request_parser.h"

#include <algorithm>
#include <cctype>

#include <llhttp.h>

namespace toolgate {
namespace http {

namespace {

HttpMethod fromLibHttpMethod(uint8_t method) {
  switch (static_cast<llhttp_method_t>(method)) {
    case HTTP_GET:
      return HttpMethod::GET;
    case HTTP_POST:
      return HttpMethod::POST;
    case HTTP_PUT:
      return HttpMethod::PUT;
    case HTTP_DELETE:
      return HttpMethod::DELETE;
    case HTTP_HEAD:
      return HttpMethod::HEAD;
    case HTTP_OPTIONS:
      return HttpMethod::OPTIONS;
    case HTTP_PATCH:
      return HttpMethod::PATCH;
    default:
      return HttpMethod::UNKNOWN;
  }
}

HttpRequestParser* self(llhttp_t* parser) {
  return static_cast<HttpRequestParser*>(parser->data);
}

}  // namespace

HttpRequestParser::HttpRequestParser(size_t max_body_bytes)
    : parser_(std::make_unique<llhttp_t>()),
      settings_(std::make_unique<llhttp_settings_t>()),
      max_body_bytes_(max_body_bytes) {
  llhttp_settings_init(settings_.get());
  settings_->on_message_begin = &HttpRequestParser::onMessageBegin;
  settings_->on_url = &HttpRequestParser::onUrl;
  settings_->on_header_field = &HttpRequestParser::onHeaderField;
  settings_->on_header_value = &HttpRequestParser::onHeaderValue;
  settings_->on_headers_complete = &HttpRequestParser::onHeadersComplete;
  settings_->on_body = &HttpRequestParser::onBody;
  settings_->on_message_complete = &HttpRequestParser::onMessageComplete;

  reset();
}

HttpRequestParser::~HttpRequestParser() = default;

void HttpRequestParser::reset() {
  llhttp_init(parser_.get(), HTTP_REQUEST, settings_.get());
  // llhttp_init clears the struct, so the back pointer is set afterwards
  parser_->data = this;

  request_ = HttpRequest();
  current_field_.clear();
  current_value_.clear();
  reading_value_ = false;
  status_ = Status::NeedMore;
  error_.clear();
  consumed_ = 0;
}

HttpRequestParser::Status HttpRequestParser::execute(const char* data,
                                                     size_t length) {
  consumed_ = 0;
  if (status_ != Status::NeedMore) {
    return status_;
  }

  llhttp_errno_t err = llhttp_execute(parser_.get(), data, length);

  if (err == HPE_OK) {
    consumed_ = length;
    return status_;
  }
  if (err == HPE_PAUSED && status_ == Status::Complete) {
    // Bytes after the pause point belong to the next request
    const char* stop = llhttp_get_error_pos(parser_.get());
    consumed_ = stop ? static_cast<size_t>(stop - data) : length;
    return status_;
  }
  if (status_ != Status::TooLarge) {
    status_ = Status::Error;
    const char* reason = llhttp_get_error_reason(parser_.get());
    error_ = reason ? reason : llhttp_errno_name(err);
  }
  return status_;
}

void HttpRequestParser::commitHeader() {
  if (!current_field_.empty()) {
    std::transform(current_field_.begin(), current_field_.end(),
                   current_field_.begin(), [](char c) {
                     return static_cast<char>(
                         std::tolower(static_cast<unsigned char>(c)));
                   });
    request_.headers[current_field_] = current_value_;
  }
  current_field_.clear();
  current_value_.clear();
  reading_value_ = false;
}

int HttpRequestParser::onMessageBegin(llhttp_t* parser) {
  auto* p = self(parser);
  p->request_ = HttpRequest();
  return 0;
}

int HttpRequestParser::onUrl(llhttp_t* parser,
                             const char* data,
                             size_t length) {
  self(parser)->request_.url.append(data, length);
  return 0;
}

int HttpRequestParser::onHeaderField(llhttp_t* parser,
                                     const char* data,
                                     size_t length) {
  auto* p = self(parser);
  if (p->reading_value_) {
    p->commitHeader();
  }
  p->current_field_.append(data, length);
  return 0;
}

int HttpRequestParser::onHeaderValue(llhttp_t* parser,
                                     const char* data,
                                     size_t length) {
  auto* p = self(parser);
  p->reading_value_ = true;
  p->current_value_.append(data, length);
  return 0;
}

int HttpRequestParser::onHeadersComplete(llhttp_t* parser) {
  auto* p = self(parser);
  p->commitHeader();

  auto& request = p->request_;
  request.method = fromLibHttpMethod(llhttp_get_method(parser));
  request.keep_alive = llhttp_should_keep_alive(parser) != 0;

  auto query_pos = request.url.find('?');
  request.path = request.url.substr(0, query_pos);
  if (query_pos != std::string::npos) {
    request.query = request.url.substr(query_pos + 1);
  }

  if (parser->content_length > p->max_body_bytes_ &&
      (parser->flags & F_CONTENT_LENGTH)) {
    p->status_ = Status::TooLarge;
    return -1;
  }
  return 0;
}

int HttpRequestParser::onBody(llhttp_t* parser,
                              const char* data,
                              size_t length) {
  auto* p = self(parser);
  if (p->request_.body.size() + length > p->max_body_bytes_) {
    p->status_ = Status::TooLarge;
    return -1;
  }
  p->request_.body.append(data, length);
  return 0;
}

int HttpRequestParser::onMessageComplete(llhttp_t* parser) {
  auto* p = self(parser);
  p->status_ = Status::Complete;
  // Stop after one request; the caller resets before reading the next
  return HPE_PAUSED;
}

}  // namespace http
}  // namespace toolgate
