#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "mocks/gateway_mocks.h"
#include "toolgate/event/libevent_dispatcher.h"
#include "toolgate/gateway/gateway.h"
#include "toolgate/server/http_server.h"

namespace toolgate {
namespace server {
namespace {

// Blocking client used from a helper thread. Reads until the peer closes,
// or until `marker` shows up when one is given.
std::string exchange(uint16_t port,
                     const std::string& request,
                     const std::string& marker) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return "";
  }

  timeval timeout{2, 0};
  ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    ::close(fd);
    return "";
  }

  ::send(fd, request.data(), request.size(), MSG_NOSIGNAL);

  std::string reply;
  char buffer[4096];
  while (true) {
    ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
    if (n <= 0) {
      break;
    }
    reply.append(buffer, static_cast<size_t>(n));
    if (!marker.empty() && reply.find(marker) != std::string::npos) {
      break;
    }
  }
  ::close(fd);
  return reply;
}

class HttpServerTest : public ::testing::Test {
 protected:
  HttpServerTest()
      : dispatcher_(event::createLibeventDispatcherFactory()->createDispatcher(
            "http")) {}

  void SetUp() override {
    gateway::ToolRegistry::Builder builder;
    builder.registerTool(
        "echo", "Returns its arguments", json::JsonValue(),
        std::make_shared<gateway::FunctionTool>(
            [](const json::JsonValue& args) { return args; }));
    gateway_ =
        std::make_unique<gateway::Gateway>(*dispatcher_, builder.build());

    HttpServer::Config config;
    config.host = "127.0.0.1";
    config.port = 0;
    server_ = std::make_unique<HttpServer>(*dispatcher_, *gateway_, config);
    ASSERT_TRUE(isSuccess(server_->start()));
    ASSERT_NE(server_->port(), 0);
  }

  void TearDown() override {
    server_.reset();
    gateway_.reset();
    dispatcher_->run(event::RunType::NonBlock);
  }

  // Runs the loop while a client thread performs one exchange
  std::string roundTrip(const std::string& request,
                        const std::string& marker = "") {
    std::string reply;
    uint16_t port = server_->port();
    event::Dispatcher* dispatcher = dispatcher_.get();
    std::thread client([&reply, port, &request, &marker, dispatcher]() {
      reply = exchange(port, request, marker);
      dispatcher->post([dispatcher]() { dispatcher->exit(); });
    });

    auto guard = dispatcher_->createTimer([this]() { dispatcher_->exit(); });
    guard->enableTimer(std::chrono::milliseconds(3000));
    dispatcher_->run(event::RunType::RunUntilExit);
    client.join();
    return reply;
  }

  static std::string post(const std::string& path, const std::string& body) {
    return "POST " + path +
           " HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n"
           "Content-Type: application/json\r\nContent-Length: " +
           std::to_string(body.size()) + "\r\n\r\n" + body;
  }

  static std::string get(const std::string& path) {
    return "GET " + path +
           " HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n";
  }

  static std::string bodyOf(const std::string& reply) {
    auto pos = reply.find("\r\n\r\n");
    return pos == std::string::npos ? "" : reply.substr(pos + 4);
  }

  event::DispatcherPtr dispatcher_;
  std::unique_ptr<gateway::Gateway> gateway_;
  std::unique_ptr<HttpServer> server_;
};

TEST_F(HttpServerTest, HealthCheck) {
  auto reply = roundTrip(get("/"));

  EXPECT_EQ(reply.rfind("HTTP/1.1 200", 0), 0u) << reply;
  auto body = json::JsonValue::parse(bodyOf(reply));
  EXPECT_EQ(body["status"], "ok");
  EXPECT_EQ(body["projectName"], "toolgate");
}

TEST_F(HttpServerTest, UnknownPaths) {
  EXPECT_EQ(roundTrip(get("/nowhere")).rfind("HTTP/1.1 404", 0), 0u);
  EXPECT_EQ(roundTrip(get("/mcp/other")).rfind("HTTP/1.1 501", 0), 0u);
}

TEST_F(HttpServerTest, PreflightAllowsCors) {
  auto reply = roundTrip(
      "OPTIONS /mcp HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");

  EXPECT_EQ(reply.rfind("HTTP/1.1 204", 0), 0u) << reply;
  EXPECT_NE(reply.find("Access-Control-Allow-Origin: *"), std::string::npos);
  EXPECT_NE(reply.find("Access-Control-Allow-Methods: GET, POST, OPTIONS"),
            std::string::npos);
}

TEST_F(HttpServerTest, PostedPing) {
  auto reply =
      roundTrip(post("/mcp", R"({"jsonrpc":"2.0","id":1,"method":"ping"})"));

  EXPECT_EQ(reply.rfind("HTTP/1.1 200", 0), 0u) << reply;
  auto body = json::JsonValue::parse(bodyOf(reply));
  EXPECT_EQ(body["id"], 1);
  EXPECT_EQ(body["result"], json::JsonValue::object());
}

TEST_F(HttpServerTest, PostedGarbageIsBadRequest) {
  auto reply = roundTrip(post("/message", "{oops"));

  EXPECT_EQ(reply.rfind("HTTP/1.1 400", 0), 0u) << reply;
  auto body = json::JsonValue::parse(bodyOf(reply));
  EXPECT_EQ(body["error"]["code"], jsonrpc::PARSE_ERROR);
}

TEST_F(HttpServerTest, DirectToolCall) {
  auto found = roundTrip(post(
      "/mcp/tools/call", R"({"id":"c1","name":"echo","arguments":{"k":2}})"));
  EXPECT_EQ(found.rfind("HTTP/1.1 200", 0), 0u) << found;
  EXPECT_EQ(json::JsonValue::parse(bodyOf(found))["result"]["k"], 2);

  auto missing =
      roundTrip(post("/mcp/tools/call", R"({"id":"c2","name":"bogus"})"));
  EXPECT_EQ(missing.rfind("HTTP/1.1 404", 0), 0u) << missing;

  auto unnamed = roundTrip(post("/mcp/tools/call", R"({"id":"c3"})"));
  EXPECT_EQ(unnamed.rfind("HTTP/1.1 404", 0), 0u) << unnamed;
  auto body = json::JsonValue::parse(bodyOf(unnamed));
  EXPECT_EQ(body["error"]["code"], jsonrpc::METHOD_NOT_FOUND);
  EXPECT_EQ(body["id"], "c3");
}

TEST_F(HttpServerTest, ToolCatalog) {
  auto reply = roundTrip(get("/mcp/tools"));

  auto body = json::JsonValue::parse(bodyOf(reply));
  EXPECT_EQ(body["id"], "tools-list");
  EXPECT_EQ(body["result"]["tools"][0]["name"], "echo");
}

TEST_F(HttpServerTest, StreamAnnouncesConnection) {
  auto reply = roundTrip(
      "GET /sse HTTP/1.1\r\nHost: localhost\r\nAccept: text/event-stream\r\n\r\n",
      "connection/established");

  EXPECT_EQ(reply.rfind("HTTP/1.1 200", 0), 0u) << reply;
  EXPECT_NE(reply.find("Content-Type: text/event-stream"), std::string::npos);
  EXPECT_NE(reply.find("data: {"), std::string::npos);

  // The client hung up; the stream is gone once the close is noticed
  test::runFor(*dispatcher_, std::chrono::milliseconds(100));
  EXPECT_EQ(gateway_->openConnections(), 0u);
}

}  // namespace
}  // namespace server
}  // namespace toolgate
