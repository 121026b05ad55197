#ifndef TOOLGATE_SERVER_HTTP_SERVER_H
#define TOOLGATE_SERVER_HTTP_SERVER_H

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "toolgate/core/result.h"
#include "toolgate/event/event_loop.h"
#include "toolgate/gateway/gateway.h"
#include "toolgate/server/http_connection.h"
#include "toolgate/server/tcp_listener.h"

namespace toolgate {
namespace server {

/**
 * @brief HTTP front end of the gateway
 *
 * Routes:
 *   GET  /sse             event stream
 *   POST /mcp, /message   one JSON-RPC envelope
 *   POST /mcp/tools/call  direct tool call {id, name, arguments}
 *   GET  /mcp/tools       tool catalog
 *   GET  /                health
 *   OPTIONS *             CORS preflight
 */
class HttpServer : public HttpConnectionCallbacks {
 public:
  struct Config {
    std::string host{"0.0.0.0"};
    uint16_t port{3000};
    size_t max_body_bytes{1024 * 1024};
    std::string project_name{"toolgate"};
    std::string project_version{"1.0.0"};
  };

  HttpServer(event::Dispatcher& dispatcher,
             gateway::Gateway& gateway,
             const Config& config);
  ~HttpServer() override;

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  VoidResult start();

  // Stop accepting and close every socket
  void stop();

  uint16_t port() const { return listener_ ? listener_->port() : 0; }
  size_t connectionCount() const { return connections_.size(); }

  // HttpConnectionCallbacks
  void onRequest(const HttpConnectionSharedPtr& connection,
                 const http::HttpRequest& request) override;
  void onClose(HttpConnection& connection) override;

 private:
  void onAccept(int fd, const std::string& peer);

  void handleStream(const HttpConnectionSharedPtr& connection);
  void handleMessage(const HttpConnectionSharedPtr& connection,
                     const http::HttpRequest& request);
  void handleToolCall(const HttpConnectionSharedPtr& connection,
                      const http::HttpRequest& request);

  event::Dispatcher& dispatcher_;
  gateway::Gateway& gateway_;
  Config config_;
  std::unique_ptr<TcpListener> listener_;
  std::map<uint64_t, HttpConnectionSharedPtr> connections_;
  uint64_t next_connection_id_{1};
};

// JSON body with Content-Type and CORS headers
http::HttpResponse jsonResponse(int status, const json::JsonValue& body);

// 204 with the preflight headers
http::HttpResponse preflightResponse();

}  // namespace server
}  // namespace toolgate

#endif  // TOOLGATE_SERVER_HTTP_SERVER_H
