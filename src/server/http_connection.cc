#define TOOLGATE_LOG_COMPONENT "transport.http"

#include "toolgate/server/http_connection.h"

#include <errno.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>

#include <nlohmann/json.hpp>

#include "toolgate/logging/log_macros.h"

namespace toolgate {
namespace server {

namespace {

constexpr size_t kReadChunk = 16384;

}  // namespace

HttpConnection::HttpConnection(event::Dispatcher& dispatcher,
                               int fd,
                               uint64_t id,
                               const std::string& peer,
                               const Config& config,
                               HttpConnectionCallbacks& callbacks)
    : dispatcher_(dispatcher),
      fd_(fd),
      id_(id),
      peer_(peer),
      config_(config),
      callbacks_(callbacks),
      parser_(config.max_body_bytes) {}

HttpConnection::~HttpConnection() {
  file_event_.reset();
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

void HttpConnection::start() {
  file_event_ = dispatcher_.createFileEvent(
      fd_, [this](uint32_t events) { onFileEvent(events); },
      event::FileTriggerType::Level,
      static_cast<uint32_t>(event::FileReadyType::Read));
  TOOLGATE_LOG(Debug, "Connection {} accepted from {}", id_, peer_);
}

void HttpConnection::onFileEvent(uint32_t events) {
  // Callbacks below may drop the server's reference
  auto self = shared_from_this();

  if (events & static_cast<uint32_t>(event::FileReadyType::Read)) {
    onReadReady();
  }
  if (state_ != State::Closed &&
      (events & static_cast<uint32_t>(event::FileReadyType::Write))) {
    onWriteReady();
  }
}

void HttpConnection::onReadReady() {
  char buffer[kReadChunk];
  while (true) {
    ssize_t n = ::read(fd_, buffer, sizeof(buffer));
    if (n > 0) {
      // A stream carries no further requests; inbound bytes are ignored
      if (state_ != State::Streaming) {
        input_.append(buffer, static_cast<size_t>(n));
      }
      continue;
    }
    if (n == 0) {
      peer_closed_ = true;
      break;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      break;
    }
    TOOLGATE_LOG(Debug, "Connection {} read error: {}", id_,
                 std::strerror(errno));
    close();
    return;
  }

  if (state_ == State::Reading) {
    processInput();
  }
  if (state_ == State::Closed) {
    return;
  }

  if (peer_closed_) {
    if (state_ == State::Processing) {
      // Still answer the request that is in flight
      close_after_flush_ = true;
      updateInterest();
    } else if (output_.empty()) {
      close();
    } else {
      close_after_flush_ = true;
      updateInterest();
    }
  }
}

void HttpConnection::onWriteReady() { flush(); }

void HttpConnection::processInput() {
  while (state_ == State::Reading && !input_.empty()) {
    auto status = parser_.execute(input_.data(), input_.size());
    switch (status) {
      case http::HttpRequestParser::Status::NeedMore:
        input_.clear();
        return;
      case http::HttpRequestParser::Status::TooLarge:
        TOOLGATE_LOG(Warning, "Connection {}: request body over {} bytes",
                     id_, config_.max_body_bytes);
        sendErrorAndClose(413, "Request body too large");
        return;
      case http::HttpRequestParser::Status::Error:
        TOOLGATE_LOG(Debug, "Connection {}: malformed request: {}", id_,
                     parser_.error());
        sendErrorAndClose(400, "Malformed HTTP request");
        return;
      case http::HttpRequestParser::Status::Complete: {
        input_.erase(0, parser_.consumed());
        http::HttpRequest request = parser_.request();
        keep_alive_ = request.keep_alive;
        state_ = State::Processing;
        TOOLGATE_LOG(Debug, "Connection {}: {} {}", id_,
                     http::httpMethodToString(request.method), request.url);
        callbacks_.onRequest(shared_from_this(), request);
        break;
      }
    }
  }
}

void HttpConnection::sendResponse(const http::HttpResponse& response) {
  if (state_ != State::Processing) {
    TOOLGATE_LOG(Debug, "Connection {}: response dropped in state {}", id_,
                 static_cast<int>(state_));
    return;
  }

  if (!keep_alive_ || peer_closed_) {
    close_after_flush_ = true;
  }

  if (close_after_flush_) {
    http::HttpResponse closing = response;
    closing.addHeader("Connection", "close");
    output_ += closing.serialize();
  } else {
    output_ += response.serialize();
  }

  if (!close_after_flush_) {
    state_ = State::Reading;
    parser_.reset();
  }
  flush();

  // Pipelined bytes that arrived while this request was in flight
  if (state_ == State::Reading && !input_.empty()) {
    std::weak_ptr<HttpConnection> weak = shared_from_this();
    dispatcher_.post([weak]() {
      auto self = weak.lock();
      if (self && self->state_ == State::Reading) {
        self->processInput();
      }
    });
  }
}

void HttpConnection::startStream(
    const std::vector<std::pair<std::string, std::string>>& headers) {
  if (state_ != State::Processing) {
    return;
  }
  state_ = State::Streaming;
  input_.clear();
  output_ += http::serializeStreamHead(200, headers);
  flush();
}

VoidResult HttpConnection::writeStream(const std::string& data) {
  if (state_ != State::Streaming) {
    return makeVoidError(Error(-1, "Stream is closed"));
  }
  if (output_.size() + data.size() > config_.max_pending_output) {
    return makeVoidError(Error(-1, "Stream output buffer is full"));
  }

  output_ += data;
  flush();

  if (state_ == State::Closed) {
    return makeVoidError(Error(-1, "Stream write failed"));
  }
  return makeVoidSuccess();
}

void HttpConnection::flush() {
  while (!output_.empty()) {
    ssize_t n = ::send(fd_, output_.data(), output_.size(), MSG_NOSIGNAL);
    if (n > 0) {
      output_.erase(0, static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      break;
    }
    TOOLGATE_LOG(Debug, "Connection {} write error: {}", id_,
                 std::strerror(errno));
    close();
    return;
  }

  if (output_.empty() && close_after_flush_) {
    close();
    return;
  }
  updateInterest();
}

void HttpConnection::updateInterest() {
  if (!file_event_ || state_ == State::Closed) {
    return;
  }
  uint32_t events = 0;
  if (!peer_closed_) {
    events |= static_cast<uint32_t>(event::FileReadyType::Read);
  }
  if (!output_.empty()) {
    events |= static_cast<uint32_t>(event::FileReadyType::Write);
  }
  file_event_->setEnabled(events);
}

void HttpConnection::sendErrorAndClose(int status, const std::string& message) {
  nlohmann::json body = {{"error", message}};
  http::HttpResponse response(status, body.dump());
  response.addHeader("Content-Type", "application/json")
      .addHeader("Access-Control-Allow-Origin", "*")
      .addHeader("Connection", "close");

  state_ = State::Processing;
  close_after_flush_ = true;
  output_ += response.serialize();
  flush();
}

void HttpConnection::close() {
  if (state_ == State::Closed) {
    return;
  }
  state_ = State::Closed;

  if (file_event_) {
    file_event_->setEnabled(0);
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  output_.clear();
  input_.clear();

  TOOLGATE_LOG(Debug, "Connection {} closed", id_);
  callbacks_.onClose(*this);
}

}  // namespace server
}  // namespace toolgate
