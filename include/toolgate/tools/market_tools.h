#ifndef TOOLGATE_TOOLS_MARKET_TOOLS_H
#define TOOLGATE_TOOLS_MARKET_TOOLS_H

#include <memory>
#include <string>
#include <vector>

#include "toolgate/gateway/tool_registry.h"
#include "toolgate/tools/bybit_client.h"
#include "toolgate/tools/tool_executor.h"

namespace toolgate {
namespace tools {

struct ToolParam {
  std::string name;
  // JSON Schema primitive: "string" or "integer"
  std::string type;
  std::string description;
  bool required{false};
  // Sent when the caller omits the argument; empty means omit
  std::string default_value;
};

struct MarketToolSpec {
  std::string name;
  std::string description;
  std::string path;
  bool authenticated{false};
  std::vector<ToolParam> params;

  json::JsonValue inputSchema() const;

  // Query parameters in declaration order, defaults filled in
  QueryParams buildQuery(const json::JsonValue& arguments) const;
};

/**
 * @brief A tool that maps its arguments to one Bybit GET request
 */
class MarketTool : public gateway::ToolCapability {
 public:
  MarketTool(MarketToolSpec spec,
             std::shared_ptr<BybitClient> client,
             std::shared_ptr<ToolExecutor> executor);

  void execute(const json::JsonValue& arguments,
               gateway::ToolCallback callback) override;

  const MarketToolSpec& spec() const { return spec_; }

 private:
  MarketToolSpec spec_;
  std::shared_ptr<BybitClient> client_;
  std::shared_ptr<ToolExecutor> executor_;
};

// The nine market and account tools
const std::vector<MarketToolSpec>& marketToolSpecs();

void registerMarketTools(gateway::ToolRegistry::Builder& builder,
                         std::shared_ptr<BybitClient> client,
                         std::shared_ptr<ToolExecutor> executor);

// Argument value as sent on the query string
std::string argumentToString(const json::JsonValue& value);

}  // namespace tools
}  // namespace toolgate

#endif  // TOOLGATE_TOOLS_MARKET_TOOLS_H
