#ifndef TOOLGATE_SERVER_HTTP_CONNECTION_H
#define TOOLGATE_SERVER_HTTP_CONNECTION_H

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "toolgate/core/result.h"
#include "toolgate/event/event_loop.h"
#include "toolgate/http/http_message.h"
#include "toolgate/http/http_request_parser.h"

namespace toolgate {
namespace server {

class HttpConnection;
using HttpConnectionSharedPtr = std::shared_ptr<HttpConnection>;

class HttpConnectionCallbacks {
 public:
  virtual ~HttpConnectionCallbacks() = default;

  // A complete request arrived. Answer with sendResponse() or startStream().
  virtual void onRequest(const HttpConnectionSharedPtr& connection,
                         const http::HttpRequest& request) = 0;

  // The socket is closed; called once
  virtual void onClose(HttpConnection& connection) = 0;
};

/**
 * @brief One accepted HTTP/1.1 socket
 *
 * Requests are served one at a time. After startStream() the connection
 * carries a text/event-stream body until either side closes it. Every
 * write appends complete frames to a single output buffer, so frames from
 * different producers never interleave.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
 public:
  enum class State { Reading, Processing, Streaming, Closed };

  struct Config {
    size_t max_body_bytes{1024 * 1024};
    // A stream whose unsent output exceeds this is treated as dead
    size_t max_pending_output{8 * 1024 * 1024};
  };

  HttpConnection(event::Dispatcher& dispatcher,
                 int fd,
                 uint64_t id,
                 const std::string& peer,
                 const Config& config,
                 HttpConnectionCallbacks& callbacks);
  ~HttpConnection();

  HttpConnection(const HttpConnection&) = delete;
  HttpConnection& operator=(const HttpConnection&) = delete;

  // Start watching the socket
  void start();

  /**
   * Send a full response. The connection then reads the next request, or
   * closes after the write when keep-alive is off.
   */
  void sendResponse(const http::HttpResponse& response);

  /**
   * Switch to streaming: writes the response head and keeps the socket
   * open for writeStream().
   */
  void startStream(
      const std::vector<std::pair<std::string, std::string>>& headers);

  // Append bytes to the stream. Fails once the connection is closed.
  VoidResult writeStream(const std::string& data);

  void close();

  uint64_t id() const { return id_; }
  const std::string& peer() const { return peer_; }
  State state() const { return state_; }
  bool isOpen() const { return state_ != State::Closed; }

  // Identifier of the gateway stream carried by this socket, if any
  const std::string& streamId() const { return stream_id_; }
  void setStreamId(const std::string& stream_id) { stream_id_ = stream_id; }

 private:
  void onFileEvent(uint32_t events);
  void onReadReady();
  void onWriteReady();
  void processInput();
  void flush();
  void updateInterest();
  void sendErrorAndClose(int status, const std::string& message);

  event::Dispatcher& dispatcher_;
  int fd_;
  uint64_t id_;
  std::string peer_;
  Config config_;
  HttpConnectionCallbacks& callbacks_;

  event::FileEventPtr file_event_;
  http::HttpRequestParser parser_;
  std::string input_;
  std::string output_;
  State state_{State::Reading};
  bool keep_alive_{false};
  bool close_after_flush_{false};
  bool peer_closed_{false};
  std::string stream_id_;
};

}  // namespace server
}  // namespace toolgate

#endif  // TOOLGATE_SERVER_HTTP_CONNECTION_H
