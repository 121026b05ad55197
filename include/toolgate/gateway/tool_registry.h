#ifndef TOOLGATE_GATEWAY_TOOL_REGISTRY_H
#define TOOLGATE_GATEWAY_TOOL_REGISTRY_H

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolgate/core/result.h"
#include "toolgate/json/envelope.h"

namespace toolgate {
namespace gateway {

using ToolResult = Result<json::JsonValue>;
using ToolCallback = std::function<void(ToolResult)>;

/**
 * @brief Executable side of a tool
 *
 * execute() may finish synchronously or later, but the callback must be
 * invoked exactly once and on the dispatcher thread.
 */
class ToolCapability {
 public:
  virtual ~ToolCapability() = default;

  // Extra checks beyond the descriptor's input schema
  virtual VoidResult validate(const json::JsonValue& arguments) const {
    (void)arguments;
    return makeVoidSuccess();
  }

  virtual void execute(const json::JsonValue& arguments,
                       ToolCallback callback) = 0;
};

using ToolCapabilitySharedPtr = std::shared_ptr<ToolCapability>;

/**
 * @brief Synchronous tool built from a function
 *
 * Exceptions thrown by the handler become tool errors.
 */
class FunctionTool : public ToolCapability {
 public:
  using Handler = std::function<json::JsonValue(const json::JsonValue&)>;

  explicit FunctionTool(Handler handler) : handler_(std::move(handler)) {}

  void execute(const json::JsonValue& arguments,
               ToolCallback callback) override;

 private:
  Handler handler_;
};

struct ToolDescriptor {
  std::string name;
  std::string description;
  // JSON Schema object describing the arguments
  json::JsonValue input_schema;
  ToolCapabilitySharedPtr capability;

  // Schema check followed by the capability's own validation
  VoidResult validate(const json::JsonValue& arguments) const;

  // {"name", "description", "inputSchema"} as listed to clients
  json::JsonValue toJson() const;
};

/**
 * Check arguments against the subset of JSON Schema used by tool
 * descriptors: "required" properties and primitive "type"s of declared
 * properties. Unknown keywords are ignored.
 */
VoidResult validateAgainstSchema(const json::JsonValue& schema,
                                 const json::JsonValue& arguments);

/**
 * @brief Immutable catalog of tools, assembled once through Builder
 */
class ToolRegistry {
 public:
  class Builder {
   public:
    /**
     * Add a tool. Throws ConfigurationError on a duplicate or empty name,
     * or a missing capability.
     */
    Builder& registerTool(ToolDescriptor descriptor);

    Builder& registerTool(const std::string& name,
                          const std::string& description,
                          const json::JsonValue& input_schema,
                          ToolCapabilitySharedPtr capability);

    std::shared_ptr<const ToolRegistry> build();

   private:
    std::vector<ToolDescriptor> tools_;
  };

  ToolRegistry() = default;

  // nullptr when no tool has that name
  const ToolDescriptor* resolve(const std::string& name) const;

  // Insertion order
  const std::vector<ToolDescriptor>& list() const { return tools_; }

  size_t size() const { return tools_.size(); }

 private:
  explicit ToolRegistry(std::vector<ToolDescriptor> tools);

  std::vector<ToolDescriptor> tools_;
  std::unordered_map<std::string, size_t> index_;
};

}  // namespace gateway
}  // namespace toolgate

#endif  // TOOLGATE_GATEWAY_TOOL_REGISTRY_H
