#define TOOLGATE_LOG_COMPONENT "gateway.dispatcher"

#include "toolgate/gateway/json_rpc_dispatcher.h"

#include <fmt/format.h>

#include "toolgate/logging/log_macros.h"

namespace toolgate {
namespace gateway {

namespace {

constexpr const char* kNotificationPrefix = "notifications/";

// Wraps a callback so that only its first invocation is forwarded
template <typename Callback>
Callback once(Callback callback) {
  auto fired = std::make_shared<bool>(false);
  return [fired, callback](auto&&... args) {
    if (*fired) {
      TOOLGATE_LOG(Warning, "Ignoring duplicate completion");
      return;
    }
    *fired = true;
    callback(std::forward<decltype(args)>(args)...);
  };
}

std::string idToString(const json::JsonValue& id) {
  return id.dump(-1, ' ', false, json::JsonValue::error_handler_t::replace);
}

// Structurally malformed input: no id from it can be trusted
json::Envelope malformedPayload() {
  return json::makeErrorResponse(
      nullptr, jsonrpc::PARSE_ERROR,
      "Parse error: payload is not a JSON-RPC request");
}

}  // namespace

JsonRpcDispatcher::JsonRpcDispatcher(std::shared_ptr<const ToolRegistry> tools,
                                     ServerInfo info)
    : tools_(std::move(tools)), info_(std::move(info)) {
  if (!tools_) {
    tools_ = std::make_shared<const ToolRegistry>();
  }
}

void JsonRpcDispatcher::dispatch(const std::string& raw,
                                 ResponseCallback callback) {
  auto parsed = json::parseJson(raw);
  if (isError(parsed)) {
    TOOLGATE_LOG(Debug, "Rejecting unparsable payload ({} bytes)", raw.size());
    callback(json::makeErrorResponse(nullptr, getError(parsed)));
    return;
  }
  dispatchValue(get<json::JsonValue>(parsed), std::move(callback));
}

void JsonRpcDispatcher::dispatchValue(const json::JsonValue& value,
                                      ResponseCallback callback) {
  auto parsed = json::parseEnvelope(value);
  if (isError(parsed)) {
    TOOLGATE_LOG(Debug, "Rejecting malformed envelope: {}",
                 getError(parsed).message);
    callback(malformedPayload());
    return;
  }

  const auto& envelope = get<json::Envelope>(parsed);
  if (envelope.isResponse()) {
    TOOLGATE_LOG(Debug, "Rejecting posted response envelope");
    callback(malformedPayload());
    return;
  }

  if (envelope.isNotification() &&
      envelope.method.compare(0, std::char_traits<char>::length(
                                     kNotificationPrefix),
                              kNotificationPrefix) == 0) {
    TOOLGATE_LOG(Debug, "Acknowledged notification {}", envelope.method);
    callback(json::makeSuccessResponse(nullptr, json::JsonValue::object()));
    return;
  }

  dispatchRequest(envelope, once(std::move(callback)));
}

void JsonRpcDispatcher::dispatchRequest(const json::Envelope& request,
                                        ResponseCallback callback) {
  const auto& method = request.method;
  json::JsonValue id = request.id;

  if (method == METHOD_INITIALIZE) {
    callback(json::makeSuccessResponse(id, initializeResult()));
    return;
  }
  if (method == METHOD_PING) {
    callback(json::makeSuccessResponse(id, json::JsonValue::object()));
    return;
  }
  if (method == METHOD_TOOLS_LIST) {
    callback(json::makeSuccessResponse(id, listTools()));
    return;
  }

  std::string tool_name;
  json::JsonValue arguments = json::JsonValue::object();

  if (method == METHOD_TOOLS_CALL) {
    // A missing or non-string name resolves as "" and is not found
    const auto& params = request.params;
    if (params.is_object()) {
      auto name_it = params.find("name");
      if (name_it != params.end() && name_it->is_string()) {
        tool_name = name_it->get<std::string>();
      }
      auto args_it = params.find("arguments");
      if (args_it != params.end() && !args_it->is_null()) {
        arguments = *args_it;
      }
    }
  } else {
    // Any other method is taken as the name of a tool
    tool_name = method;
    if (!request.params.is_null()) {
      arguments = request.params;
    }
  }

  const ToolDescriptor* tool = tools_->resolve(tool_name);
  if (!tool) {
    TOOLGATE_LOG(Debug, "Unknown tool {} requested (id {})", tool_name,
                 idToString(id));
    callback(json::makeErrorResponse(
        id, jsonrpc::METHOD_NOT_FOUND,
        fmt::format("Method not found: {}", tool_name)));
    return;
  }

  invokeTool(*tool, arguments, [id, callback, tool_name](ToolResult result) {
    if (isError(result)) {
      logging::LogContext context;
      context.request_id = idToString(id);
      context.tool_name = tool_name;
      TOOLGATE_LOG_WITH_CONTEXT(Debug, context, "Request failed with code {}",
                                getError(result).code);
      callback(json::makeErrorResponse(id, jsonrpc::TOOL_ERROR,
                                       getError(result).message));
      return;
    }
    callback(json::makeSuccessResponse(id, get<json::JsonValue>(result)));
  });
}

void JsonRpcDispatcher::dispatchToolCall(const json::JsonValue& id,
                                         const std::string& name,
                                         const json::JsonValue& arguments,
                                         ToolCallCallback callback) {
  const ToolDescriptor* tool = tools_->resolve(name);
  if (!tool) {
    TOOLGATE_LOG(Debug, "Direct call to unknown tool {}", name);
    callback(ToolCallOutcome{
        404, json::makeErrorResponse(id, jsonrpc::METHOD_NOT_FOUND,
                                     fmt::format("Tool not found: {}", name))});
    return;
  }

  auto done = once(std::move(callback));
  invokeTool(*tool, arguments.is_null() ? json::JsonValue::object() : arguments,
             [id, done](ToolResult result) {
               if (isError(result)) {
                 done(ToolCallOutcome{
                     500, json::makeErrorResponse(id, jsonrpc::TOOL_ERROR,
                                                  getError(result).message)});
                 return;
               }
               done(ToolCallOutcome{
                   200, json::makeSuccessResponse(
                            id, get<json::JsonValue>(result))});
             });
}

void JsonRpcDispatcher::invokeTool(const ToolDescriptor& tool,
                                   const json::JsonValue& arguments,
                                   ToolCallback callback) {
  auto validation = tool.validate(arguments);
  if (isError(validation)) {
    TOOLGATE_LOG(Debug, "Tool {} rejected arguments: {}", tool.name,
                 getError(validation).message);
    callback(makeError<json::JsonValue>(jsonrpc::TOOL_ERROR,
                                        getError(validation).message));
    return;
  }

  auto done = once(std::move(callback));
  std::string name = tool.name;
  try {
    tool.capability->execute(arguments, [done, name](ToolResult result) {
      if (isError(result)) {
        TOOLGATE_LOG(Warning, "Tool {} failed: {}", name,
                     getError(result).message);
      }
      done(std::move(result));
    });
  } catch (const std::exception& e) {
    TOOLGATE_LOG(Error, "Tool {} threw: {}", name, e.what());
    done(makeError<json::JsonValue>(jsonrpc::TOOL_ERROR, e.what()));
  }
}

json::JsonValue JsonRpcDispatcher::listTools() const {
  json::JsonValue tools = json::JsonValue::array();
  for (const auto& tool : tools_->list()) {
    tools.push_back(tool.toJson());
  }
  return json::JsonValue{{"tools", tools}};
}

json::JsonValue JsonRpcDispatcher::initializeResult() const {
  json::JsonValue result = json::JsonValue::object();
  result["protocolVersion"] = info_.protocol_version;
  result["capabilities"] = {{"tools", {{"listChanged", false}}}};
  result["serverInfo"] = {{"name", info_.name}, {"version", info_.version}};
  return result;
}

}  // namespace gateway
}  // namespace toolgate
