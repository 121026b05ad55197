#ifndef TOOLGATE_GATEWAY_GATEWAY_H
#define TOOLGATE_GATEWAY_GATEWAY_H

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "toolgate/core/compat.h"
#include "toolgate/event/event_loop.h"
#include "toolgate/gateway/connection_registry.h"
#include "toolgate/gateway/heartbeat_scheduler.h"
#include "toolgate/gateway/json_rpc_dispatcher.h"
#include "toolgate/gateway/message_broadcaster.h"
#include "toolgate/gateway/tool_registry.h"

namespace toolgate {
namespace gateway {

enum class ConnectionState { Connecting, Open, Closing, Closed };

const char* connectionStateToString(ConnectionState state);

/**
 * @brief Composition of registry, broadcaster, heartbeats and dispatcher
 *
 * Owns the per-connection lifecycle:
 *
 *   Connecting -> Open -> Closing -> Closed
 *
 * A connection that reaches Closed is forgotten; a client has to open a new
 * stream to receive broadcasts again. All methods run on the dispatcher
 * thread.
 */
class Gateway {
 public:
  struct Options {
    std::chrono::milliseconds heartbeat_interval{kDefaultHeartbeatInterval};
    MessageBroadcaster::Config broadcaster;
    ServerInfo server_info;
  };

  // HTTP status plus the envelope to return for a posted message
  using PostCallback =
      std::function<void(int http_status, const json::Envelope& response)>;
  using ToolCallCallback = JsonRpcDispatcher::ToolCallCallback;

  Gateway(event::Dispatcher& dispatcher,
          std::shared_ptr<const ToolRegistry> tools,
          const Options& options);
  Gateway(event::Dispatcher& dispatcher,
          std::shared_ptr<const ToolRegistry> tools);
  ~Gateway();

  Gateway(const Gateway&) = delete;
  Gateway& operator=(const Gateway&) = delete;

  /**
   * Accept a stream: register it, announce its id, drain buffered messages
   * and start its heartbeat.
   *
   * @return the connection id. The stream may already be Closed when the
   *         announcement could not be written.
   */
  std::string openStream(OutputChannelSharedPtr channel);

  /**
   * Transport-side closure. Safe to call more than once and for ids that
   * were already closed by a write failure.
   */
  void closeStream(const std::string& connection_id);

  /**
   * Answer one envelope posted in a request body. A body that is not a
   * JSON-RPC request yields status 400 with a parse error; everything else
   * yields 200.
   */
  void handlePostMessage(const std::string& body, PostCallback callback);

  /**
   * Direct call of the form {"id", "name", "arguments"}. A missing name is
   * looked up as "" and so is not found.
   */
  void handleToolCall(const std::string& body, ToolCallCallback callback);

  // {"jsonrpc":"2.0","id":"tools-list","result":{"tools":[...]}}
  json::Envelope listTools() const;

  /**
   * Server-originated broadcast, buffered when no stream is open.
   */
  void notify(const json::JsonValue& payload,
              const std::string& level = "info");

  /**
   * Close every open stream. Later openStream calls still work.
   */
  void shutdown();

  // nullopt for unknown ids and for streams that reached Closed
  optional<ConnectionState> connectionState(
      const std::string& connection_id) const;

  size_t openConnections() const { return registry_.size(); }

  ConnectionRegistry& registry() { return registry_; }
  MessageBroadcaster& broadcaster() { return broadcaster_; }
  JsonRpcDispatcher& rpcDispatcher() { return rpc_; }

 private:
  struct Stream {
    ConnectionState state{ConnectionState::Connecting};
    OutputChannelSharedPtr channel;
    std::unique_ptr<HeartbeatScheduler> heartbeat;
  };

  void closeConnection(const std::string& connection_id, const char* reason);

  event::Dispatcher& dispatcher_;
  Options options_;
  ConnectionRegistry registry_;
  MessageBroadcaster broadcaster_;
  JsonRpcDispatcher rpc_;
  std::map<std::string, Stream> streams_;
};

}  // namespace gateway
}  // namespace toolgate

#endif  // TOOLGATE_GATEWAY_GATEWAY_H
