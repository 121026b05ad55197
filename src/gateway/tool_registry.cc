#define TOOLGATE_LOG_COMPONENT "gateway.tools"

#include "toolgate/gateway/tool_registry.h"

#include <fmt/format.h>

#include "toolgate/logging/log_macros.h"

namespace toolgate {
namespace gateway {

namespace {

bool matchesType(const std::string& type, const json::JsonValue& value) {
  if (type == "string") return value.is_string();
  if (type == "integer") return value.is_number_integer();
  if (type == "number") return value.is_number();
  if (type == "boolean") return value.is_boolean();
  if (type == "object") return value.is_object();
  if (type == "array") return value.is_array();
  if (type == "null") return value.is_null();
  // Unknown type names are not enforced
  return true;
}

bool matchesAnyType(const json::JsonValue& type, const json::JsonValue& value) {
  if (type.is_string()) {
    return matchesType(type.get<std::string>(), value);
  }
  if (type.is_array()) {
    for (const auto& candidate : type) {
      if (candidate.is_string() &&
          matchesType(candidate.get<std::string>(), value)) {
        return true;
      }
    }
    return false;
  }
  return true;
}

}  // namespace

void FunctionTool::execute(const json::JsonValue& arguments,
                           ToolCallback callback) {
  json::JsonValue output;
  try {
    output = handler_(arguments);
  } catch (const std::exception& e) {
    callback(makeError<json::JsonValue>(jsonrpc::TOOL_ERROR, e.what()));
    return;
  }
  callback(makeSuccess(std::move(output)));
}

VoidResult validateAgainstSchema(const json::JsonValue& schema,
                                 const json::JsonValue& arguments) {
  if (!schema.is_object()) {
    return makeVoidSuccess();
  }

  auto type_it = schema.find("type");
  if (type_it != schema.end() && !matchesAnyType(*type_it, arguments)) {
    return makeVoidError(
        Error(jsonrpc::TOOL_ERROR, "Invalid arguments: wrong type"));
  }
  if (!arguments.is_object()) {
    return makeVoidSuccess();
  }

  auto required_it = schema.find("required");
  if (required_it != schema.end() && required_it->is_array()) {
    for (const auto& name : *required_it) {
      if (name.is_string() && !arguments.contains(name.get<std::string>())) {
        return makeVoidError(
            Error(jsonrpc::TOOL_ERROR,
                  fmt::format("Missing required argument: {}",
                              name.get<std::string>())));
      }
    }
  }

  auto props_it = schema.find("properties");
  if (props_it == schema.end() || !props_it->is_object()) {
    return makeVoidSuccess();
  }
  for (auto it = props_it->begin(); it != props_it->end(); ++it) {
    auto arg = arguments.find(it.key());
    if (arg == arguments.end() || !it.value().is_object()) {
      continue;
    }
    auto prop_type = it.value().find("type");
    if (prop_type != it.value().end() && !matchesAnyType(*prop_type, *arg)) {
      return makeVoidError(Error(
          jsonrpc::TOOL_ERROR,
          fmt::format("Invalid type for argument: {}", it.key())));
    }
  }
  return makeVoidSuccess();
}

VoidResult ToolDescriptor::validate(const json::JsonValue& arguments) const {
  auto result = validateAgainstSchema(input_schema, arguments);
  if (isError(result) || !capability) {
    return result;
  }
  return capability->validate(arguments);
}

json::JsonValue ToolDescriptor::toJson() const {
  json::JsonValue j = json::JsonValue::object();
  j["name"] = name;
  j["description"] = description;
  j["inputSchema"] = input_schema.is_null()
                         ? json::JsonValue{{"type", "object"}}
                         : input_schema;
  return j;
}

ToolRegistry::Builder& ToolRegistry::Builder::registerTool(
    ToolDescriptor descriptor) {
  if (descriptor.name.empty()) {
    throw ConfigurationError("Tool name must not be empty");
  }
  if (!descriptor.capability) {
    throw ConfigurationError(
        fmt::format("Tool '{}' has no capability", descriptor.name));
  }
  for (const auto& existing : tools_) {
    if (existing.name == descriptor.name) {
      throw ConfigurationError(
          fmt::format("Tool '{}' is already registered", descriptor.name));
    }
  }

  TOOLGATE_LOG(Debug, "Registered tool {}", descriptor.name);
  tools_.push_back(std::move(descriptor));
  return *this;
}

ToolRegistry::Builder& ToolRegistry::Builder::registerTool(
    const std::string& name,
    const std::string& description,
    const json::JsonValue& input_schema,
    ToolCapabilitySharedPtr capability) {
  ToolDescriptor descriptor;
  descriptor.name = name;
  descriptor.description = description;
  descriptor.input_schema = input_schema;
  descriptor.capability = std::move(capability);
  return registerTool(std::move(descriptor));
}

std::shared_ptr<const ToolRegistry> ToolRegistry::Builder::build() {
  // Private constructor, so no make_shared
  std::shared_ptr<const ToolRegistry> registry(
      new ToolRegistry(std::move(tools_)));
  tools_.clear();
  TOOLGATE_LOG(Info, "Tool registry built with {} tool(s)", registry->size());
  return registry;
}

ToolRegistry::ToolRegistry(std::vector<ToolDescriptor> tools)
    : tools_(std::move(tools)) {
  for (size_t i = 0; i < tools_.size(); ++i) {
    index_[tools_[i].name] = i;
  }
}

const ToolDescriptor* ToolRegistry::resolve(const std::string& name) const {
  auto it = index_.find(name);
  if (it == index_.end()) {
    return nullptr;
  }
  return &tools_[it->second];
}

}  // namespace gateway
}  // namespace toolgate
