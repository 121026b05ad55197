#define TOOLGATE_LOG_COMPONENT "tools.market"

#include "toolgate/tools/market_tools.h"

#include "toolgate/logging/log_macros.h"

namespace toolgate {
namespace tools {

namespace {

ToolParam category(const std::string& default_value) {
  return ToolParam{"category", "string",
                   "Product type: spot, linear, inverse or option", false,
                   default_value};
}

ToolParam symbol(bool required) {
  return ToolParam{"symbol", "string", "Trading pair, e.g. BTCUSDT", required,
                   ""};
}

ToolParam limit(const std::string& default_value) {
  return ToolParam{"limit", "integer", "Maximum number of entries", false,
                   default_value};
}

std::vector<MarketToolSpec> buildSpecs() {
  std::vector<MarketToolSpec> specs;

  specs.push_back({"get_ticker",
                   "Get the latest ticker for a trading pair",
                   "/v5/market/tickers",
                   false,
                   {category("spot"), symbol(true)}});

  specs.push_back({"get_orderbook",
                   "Get the order book depth for a trading pair",
                   "/v5/market/orderbook",
                   false,
                   {category("spot"), symbol(true), limit("25")}});

  specs.push_back({"get_trades",
                   "Get recent public trades for a trading pair",
                   "/v5/market/recent-trade",
                   false,
                   {category("spot"), symbol(true), limit("200")}});

  specs.push_back(
      {"get_kline",
       "Get candlestick data for a trading pair",
       "/v5/market/kline",
       false,
       {category("spot"), symbol(true),
        ToolParam{"interval", "string",
                  "Candle interval: 1,3,5,15,30,60,120,240,360,720,D,W,M",
                  false, "60"},
        ToolParam{"start", "integer", "Start time in ms", false, ""},
        ToolParam{"end", "integer", "End time in ms", false, ""},
        limit("200")}});

  specs.push_back({"get_market_info",
                   "List instruments and their trading rules",
                   "/v5/market/instruments-info",
                   false,
                   {category("spot"), symbol(false), limit("200")}});

  specs.push_back({"get_instrument_info",
                   "Get trading rules for one instrument",
                   "/v5/market/instruments-info",
                   false,
                   {category("spot"), symbol(true)}});

  specs.push_back(
      {"get_wallet_balance",
       "Get wallet balances (requires API credentials)",
       "/v5/account/wallet-balance",
       true,
       {ToolParam{"accountType", "string", "Account type: UNIFIED or CONTRACT",
                  false, "UNIFIED"},
        ToolParam{"coin", "string", "Comma separated coin names", false, ""}}});

  specs.push_back(
      {"get_positions",
       "Get open positions (requires API credentials)",
       "/v5/position/list",
       true,
       {category("linear"), symbol(false),
        ToolParam{"settleCoin", "string", "Settlement coin, e.g. USDT", false,
                  ""}}});

  specs.push_back({"get_order_history",
                   "Get order history (requires API credentials)",
                   "/v5/order/history",
                   true,
                   {category("spot"), symbol(false), limit("50")}});

  return specs;
}

}  // namespace

std::string argumentToString(const json::JsonValue& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_boolean()) {
    return value.get<bool>() ? "true" : "false";
  }
  return value.dump();
}

json::JsonValue MarketToolSpec::inputSchema() const {
  json::JsonValue properties = json::JsonValue::object();
  json::JsonValue required = json::JsonValue::array();

  for (const auto& param : params) {
    json::JsonValue property = {{"type", param.type},
                                {"description", param.description}};
    if (!param.default_value.empty()) {
      property["default"] = param.default_value;
    }
    properties[param.name] = property;
    if (param.required) {
      required.push_back(param.name);
    }
  }

  json::JsonValue schema = {{"type", "object"}, {"properties", properties}};
  if (!required.empty()) {
    schema["required"] = required;
  }
  return schema;
}

QueryParams MarketToolSpec::buildQuery(const json::JsonValue& arguments) const {
  QueryParams query;
  for (const auto& param : params) {
    if (arguments.is_object()) {
      auto it = arguments.find(param.name);
      if (it != arguments.end() && !it->is_null()) {
        query.emplace_back(param.name, argumentToString(*it));
        continue;
      }
    }
    if (!param.default_value.empty()) {
      query.emplace_back(param.name, param.default_value);
    }
  }
  return query;
}

MarketTool::MarketTool(MarketToolSpec spec,
                       std::shared_ptr<BybitClient> client,
                       std::shared_ptr<ToolExecutor> executor)
    : spec_(std::move(spec)),
      client_(std::move(client)),
      executor_(std::move(executor)) {}

void MarketTool::execute(const json::JsonValue& arguments,
                         gateway::ToolCallback callback) {
  QueryParams query = spec_.buildQuery(arguments);
  std::shared_ptr<BybitClient> client = client_;
  std::string path = spec_.path;
  bool authenticated = spec_.authenticated;

  TOOLGATE_LOG(Debug, "{} -> GET {}", spec_.name, path);
  executor_->run(
      [client, path, query, authenticated]() {
        return client->get(path, query, authenticated);
      },
      std::move(callback));
}

const std::vector<MarketToolSpec>& marketToolSpecs() {
  static const std::vector<MarketToolSpec> specs = buildSpecs();
  return specs;
}

void registerMarketTools(gateway::ToolRegistry::Builder& builder,
                         std::shared_ptr<BybitClient> client,
                         std::shared_ptr<ToolExecutor> executor) {
  for (const auto& spec : marketToolSpecs()) {
    builder.registerTool(spec.name, spec.description, spec.inputSchema(),
                         std::make_shared<MarketTool>(spec, client, executor));
  }
  TOOLGATE_LOG(Info, "Registered {} market tools ({})",
               marketToolSpecs().size(),
               client->hasCredentials() ? "authenticated" : "public only");
}

}  // namespace tools
}  // namespace toolgate
