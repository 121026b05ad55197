#define TOOLGATE_LOG_COMPONENT "transport.server"

#include "toolgate/server/http_server.h"

#include <vector>

#include "toolgate/logging/log_macros.h"
#include "toolgate/server/sse_channel.h"

namespace toolgate {
namespace server {

namespace {

constexpr const char* kAllowOrigin = "*";
constexpr const char* kAllowMethods = "GET, POST, OPTIONS";
constexpr const char* kAllowHeaders = "Content-Type, Mcp-Version, Mcp-Session-Id";

bool startsWith(const std::string& value, const char* prefix) {
  return value.compare(0, std::char_traits<char>::length(prefix), prefix) ==
         0;
}

}  // namespace

http::HttpResponse jsonResponse(int status, const json::JsonValue& body) {
  http::HttpResponse response(
      status, body.dump(-1, ' ', false, json::JsonValue::error_handler_t::replace));
  response.addHeader("Content-Type", "application/json")
      .addHeader("Access-Control-Allow-Origin", kAllowOrigin);
  return response;
}

http::HttpResponse preflightResponse() {
  http::HttpResponse response(204, "");
  response.addHeader("Access-Control-Allow-Origin", kAllowOrigin)
      .addHeader("Access-Control-Allow-Methods", kAllowMethods)
      .addHeader("Access-Control-Allow-Headers", kAllowHeaders);
  return response;
}

HttpServer::HttpServer(event::Dispatcher& dispatcher,
                       gateway::Gateway& gateway,
                       const Config& config)
    : dispatcher_(dispatcher), gateway_(gateway), config_(config) {}

HttpServer::~HttpServer() { stop(); }

VoidResult HttpServer::start() {
  TcpListener::Config listener_config;
  listener_config.host = config_.host;
  listener_config.port = config_.port;

  listener_ = std::make_unique<TcpListener>(
      dispatcher_, listener_config,
      [this](int fd, const std::string& peer) { onAccept(fd, peer); });

  auto result = listener_->listen();
  if (isError(result)) {
    listener_.reset();
    return result;
  }
  TOOLGATE_LOG(Info, "{} {} serving HTTP on {}:{}", config_.project_name,
               config_.project_version, config_.host, listener_->port());
  return makeVoidSuccess();
}

void HttpServer::stop() {
  listener_.reset();

  std::vector<HttpConnectionSharedPtr> open;
  open.reserve(connections_.size());
  for (const auto& entry : connections_) {
    open.push_back(entry.second);
  }
  for (const auto& connection : open) {
    connection->close();
  }
}

void HttpServer::onAccept(int fd, const std::string& peer) {
  HttpConnection::Config connection_config;
  connection_config.max_body_bytes = config_.max_body_bytes;

  uint64_t id = next_connection_id_++;
  auto connection = std::make_shared<HttpConnection>(
      dispatcher_, fd, id, peer, connection_config, *this);
  connections_[id] = connection;
  connection->start();
}

void HttpServer::onClose(HttpConnection& connection) {
  if (!connection.streamId().empty()) {
    gateway_.closeStream(connection.streamId());
  }

  auto it = connections_.find(connection.id());
  if (it == connections_.end()) {
    return;
  }
  // We may be inside the connection's own event callback
  HttpConnectionSharedPtr doomed = std::move(it->second);
  connections_.erase(it);
  dispatcher_.post([doomed]() mutable { doomed.reset(); });
}

void HttpServer::onRequest(const HttpConnectionSharedPtr& connection,
                           const http::HttpRequest& request) {
  const std::string& path = request.path;

  if (request.method == http::HttpMethod::OPTIONS) {
    connection->sendResponse(preflightResponse());
    return;
  }

  if (path == "/" && request.method == http::HttpMethod::GET) {
    json::JsonValue body = {
        {"status", "ok"},
        {"message", config_.project_name + " gateway is running"},
        {"projectName", config_.project_name},
        {"projectVersion", config_.project_version}};
    connection->sendResponse(jsonResponse(200, body));
    return;
  }

  if (path == "/sse" && request.method == http::HttpMethod::GET) {
    handleStream(connection);
    return;
  }

  if ((path == "/mcp" || path == "/message") &&
      request.method == http::HttpMethod::POST) {
    handleMessage(connection, request);
    return;
  }

  if (path == "/mcp/tools" && request.method == http::HttpMethod::GET) {
    connection->sendResponse(
        jsonResponse(200, gateway_.listTools().toJson()));
    return;
  }

  if (path == "/mcp/tools/call" && request.method == http::HttpMethod::POST) {
    handleToolCall(connection, request);
    return;
  }

  if (startsWith(path, "/mcp")) {
    connection->sendResponse(
        jsonResponse(501, {{"error", "MCP endpoint not implemented"}}));
    return;
  }

  connection->sendResponse(jsonResponse(404, {{"error", "Not found"}}));
}

void HttpServer::handleStream(const HttpConnectionSharedPtr& connection) {
  connection->startStream({{"Content-Type", "text/event-stream"},
                           {"Cache-Control", "no-cache"},
                           {"Connection", "keep-alive"},
                           {"Access-Control-Allow-Origin", kAllowOrigin}});
  if (!connection->isOpen()) {
    return;
  }

  auto channel = std::make_shared<SseChannel>(connection);
  std::string stream_id = gateway_.openStream(channel);
  if (connection->isOpen()) {
    connection->setStreamId(stream_id);
  }
  TOOLGATE_LOG(Debug, "Socket {} carries stream {}", connection->id(),
               stream_id);
}

void HttpServer::handleMessage(const HttpConnectionSharedPtr& connection,
                               const http::HttpRequest& request) {
  std::weak_ptr<HttpConnection> weak = connection;
  gateway_.handlePostMessage(
      request.body, [weak](int status, const json::Envelope& response) {
        auto conn = weak.lock();
        if (!conn) {
          return;
        }
        conn->sendResponse(jsonResponse(status, response.toJson()));
      });
}

void HttpServer::handleToolCall(const HttpConnectionSharedPtr& connection,
                                const http::HttpRequest& request) {
  std::weak_ptr<HttpConnection> weak = connection;
  gateway_.handleToolCall(
      request.body,
      [weak](const gateway::JsonRpcDispatcher::ToolCallOutcome& outcome) {
        auto conn = weak.lock();
        if (!conn) {
          return;
        }
        conn->sendResponse(
            jsonResponse(outcome.http_status, outcome.envelope.toJson()));
      });
}

}  // namespace server
}  // namespace toolgate
