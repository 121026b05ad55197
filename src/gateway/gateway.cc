#define TOOLGATE_LOG_COMPONENT "gateway"

#include "toolgate/gateway/gateway.h"

#include <vector>

#include "toolgate/logging/log_macros.h"

namespace toolgate {
namespace gateway {

namespace {

constexpr const char* kToolsListId = "tools-list";

}  // namespace

const char* connectionStateToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::Connecting:
      return "Connecting";
    case ConnectionState::Open:
      return "Open";
    case ConnectionState::Closing:
      return "Closing";
    case ConnectionState::Closed:
      return "Closed";
  }
  return "Unknown";
}

Gateway::Gateway(event::Dispatcher& dispatcher,
                 std::shared_ptr<const ToolRegistry> tools)
    : Gateway(dispatcher, std::move(tools), Options()) {}

Gateway::Gateway(event::Dispatcher& dispatcher,
                 std::shared_ptr<const ToolRegistry> tools,
                 const Options& options)
    : dispatcher_(dispatcher),
      options_(options),
      broadcaster_(registry_, options.broadcaster),
      rpc_(std::move(tools), options.server_info) {
  broadcaster_.setWriteFailureCallback([this](const std::string& id) {
    closeConnection(id, "write failure");
  });
}

Gateway::~Gateway() {
  broadcaster_.setWriteFailureCallback(nullptr);
  shutdown();
}

std::string Gateway::openStream(OutputChannelSharedPtr channel) {
  std::string id = registry_.registerConnection(channel);
  Stream& stream = streams_[id];
  stream.channel = std::move(channel);
  stream.state = ConnectionState::Connecting;

  TOOLGATE_LOG(Info, "Stream {} connecting ({} open)", id, registry_.size());

  auto connection = registry_.find(id);
  auto established = json::makeNotification(
      json::METHOD_CONNECTION_ESTABLISHED, json::JsonValue{{"id", id}});
  if (!broadcaster_.writeTo(connection, established)) {
    // The write-failure callback has already closed the stream
    return id;
  }
  stream.state = ConnectionState::Open;

  broadcaster_.onConnectionOpened(connection);
  if (!registry_.contains(id)) {
    return id;
  }

  stream.heartbeat = std::make_unique<HeartbeatScheduler>(
      dispatcher_, registry_, broadcaster_, id, options_.heartbeat_interval);
  stream.heartbeat->start();

  TOOLGATE_LOG(Info, "Stream {} open", id);
  return id;
}

void Gateway::closeStream(const std::string& connection_id) {
  closeConnection(connection_id, "transport closed");
}

void Gateway::closeConnection(const std::string& connection_id,
                              const char* reason) {
  auto it = streams_.find(connection_id);
  if (it == streams_.end()) {
    registry_.remove(connection_id);
    return;
  }
  if (it->second.state == ConnectionState::Closing ||
      it->second.state == ConnectionState::Closed) {
    return;
  }

  it->second.state = ConnectionState::Closing;
  registry_.remove(connection_id);

  // Detach first: channel close may re-enter closeStream for this id
  Stream stream = std::move(it->second);

  if (stream.heartbeat) {
    stream.heartbeat->cancel();
    // This may run inside the heartbeat's own tick, so the timer is
    // destroyed on a later iteration
    std::shared_ptr<HeartbeatScheduler> doomed(std::move(stream.heartbeat));
    dispatcher_.post([doomed]() mutable { doomed.reset(); });
  }

  if (stream.channel) {
    stream.channel->close();
  }

  streams_.erase(connection_id);
  TOOLGATE_LOG(Info, "Stream {} closed: {} ({} open)", connection_id, reason,
               registry_.size());
}

void Gateway::handlePostMessage(const std::string& body,
                                PostCallback callback) {
  rpc_.dispatch(body, [callback](const json::Envelope& response) {
    int status = 200;
    if (response.kind == json::EnvelopeKind::Error &&
        response.error.code == jsonrpc::PARSE_ERROR) {
      status = 400;
    }
    callback(status, response);
  });
}

void Gateway::handleToolCall(const std::string& body,
                             ToolCallCallback callback) {
  using Outcome = JsonRpcDispatcher::ToolCallOutcome;

  auto parsed = json::parseJson(body);
  if (isError(parsed)) {
    callback(Outcome{400, json::makeErrorResponse(nullptr, getError(parsed))});
    return;
  }

  const auto& value = get<json::JsonValue>(parsed);
  if (!value.is_object()) {
    callback(Outcome{
        400, json::makeErrorResponse(nullptr, jsonrpc::PARSE_ERROR,
                                     "Parse error: expected a JSON object")});
    return;
  }

  json::JsonValue id = json::extractId(value);
  std::string name;
  auto name_it = value.find("name");
  if (name_it != value.end() && name_it->is_string()) {
    name = name_it->get<std::string>();
  }

  json::JsonValue arguments = json::JsonValue::object();
  auto args_it = value.find("arguments");
  if (args_it != value.end() && !args_it->is_null()) {
    arguments = *args_it;
  }

  rpc_.dispatchToolCall(id, name, arguments, std::move(callback));
}

json::Envelope Gateway::listTools() const {
  return json::makeSuccessResponse(kToolsListId, rpc_.listTools());
}

void Gateway::notify(const json::JsonValue& payload,
                     const std::string& level) {
  broadcaster_.send(payload, level);
}

void Gateway::shutdown() {
  std::vector<std::string> ids;
  ids.reserve(streams_.size());
  for (const auto& entry : streams_) {
    ids.push_back(entry.first);
  }
  if (!ids.empty()) {
    TOOLGATE_LOG(Info, "Shutting down {} stream(s)", ids.size());
  }
  for (const auto& id : ids) {
    closeConnection(id, "shutdown");
  }
}

optional<ConnectionState> Gateway::connectionState(
    const std::string& connection_id) const {
  auto it = streams_.find(connection_id);
  if (it == streams_.end()) {
    return nullopt;
  }
  return it->second.state;
}

}  // namespace gateway
}  // namespace toolgate
