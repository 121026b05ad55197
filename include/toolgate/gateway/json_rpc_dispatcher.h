#ifndef TOOLGATE_GATEWAY_JSON_RPC_DISPATCHER_H
#define TOOLGATE_GATEWAY_JSON_RPC_DISPATCHER_H

#include <functional>
#include <memory>
#include <string>

#include "toolgate/gateway/tool_registry.h"
#include "toolgate/json/envelope.h"

namespace toolgate {
namespace gateway {

// Built-in methods answered without a registered tool
constexpr const char* METHOD_INITIALIZE = "initialize";
constexpr const char* METHOD_PING = "ping";
constexpr const char* METHOD_TOOLS_LIST = "tools/list";
constexpr const char* METHOD_TOOLS_CALL = "tools/call";

struct ServerInfo {
  std::string name{"toolgate"};
  std::string version{"1.0.0"};
  std::string protocol_version{"2024-11-05"};
};

/**
 * @brief Routes JSON-RPC requests to tools and builds correlated responses
 *
 * Every request produces exactly one response through its callback. The id
 * of the request is echoed unchanged; it is null only when the request
 * could not be read far enough to find one.
 */
class JsonRpcDispatcher {
 public:
  using ResponseCallback = std::function<void(const json::Envelope&)>;

  // Response of the direct tool-call endpoint with its HTTP status
  struct ToolCallOutcome {
    int http_status{200};
    json::Envelope envelope;
  };
  using ToolCallCallback = std::function<void(const ToolCallOutcome&)>;

  explicit JsonRpcDispatcher(std::shared_ptr<const ToolRegistry> tools,
                             ServerInfo info = ServerInfo());

  /**
   * Parse raw text as one envelope and answer it.
   */
  void dispatch(const std::string& raw, ResponseCallback callback);

  /**
   * Answer an already parsed JSON value. A value that is not a request
   * envelope is answered with a parse error and a null id.
   */
  void dispatchValue(const json::JsonValue& value, ResponseCallback callback);

  /**
   * Invoke a named tool directly. Status is 200 on success, 404 when the
   * tool does not exist and 500 when it fails.
   */
  void dispatchToolCall(const json::JsonValue& id,
                        const std::string& name,
                        const json::JsonValue& arguments,
                        ToolCallCallback callback);

  // {"tools":[{name, description, inputSchema}, ...]}
  json::JsonValue listTools() const;

  const ToolRegistry& tools() const { return *tools_; }
  const ServerInfo& serverInfo() const { return info_; }

 private:
  void dispatchRequest(const json::Envelope& request,
                       ResponseCallback callback);

  // Validate and execute; the callback fires once with the tool's result
  void invokeTool(const ToolDescriptor& tool,
                  const json::JsonValue& arguments,
                  ToolCallback callback);

  json::JsonValue initializeResult() const;

  std::shared_ptr<const ToolRegistry> tools_;
  ServerInfo info_;
};

}  // namespace gateway
}  // namespace toolgate

#endif  // TOOLGATE_GATEWAY_JSON_RPC_DISPATCHER_H
