#include <algorithm>
#include <stdexcept>

#include <gtest/gtest.h>

#include "mocks/gateway_mocks.h"
#include "toolgate/tools/market_tools.h"

namespace toolgate {
namespace tools {
namespace {

using test::MockRestClient;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SaveArg;

const MarketToolSpec& specNamed(const std::string& name) {
  const auto& specs = marketToolSpecs();
  auto it = std::find_if(specs.begin(), specs.end(),
                         [&name](const MarketToolSpec& s) {
                           return s.name == name;
                         });
  if (it == specs.end()) {
    throw std::out_of_range(name);
  }
  return *it;
}

TEST(MarketToolSpecsTest, NineToolsWithUniqueNames) {
  const auto& specs = marketToolSpecs();
  ASSERT_EQ(specs.size(), 9u);

  std::vector<std::string> names;
  for (const auto& spec : specs) {
    names.push_back(spec.name);
  }
  std::sort(names.begin(), names.end());
  EXPECT_TRUE(std::unique(names.begin(), names.end()) == names.end());
}

TEST(MarketToolSpecsTest, PrivateToolsAreAuthenticated) {
  EXPECT_TRUE(specNamed("get_wallet_balance").authenticated);
  EXPECT_TRUE(specNamed("get_positions").authenticated);
  EXPECT_TRUE(specNamed("get_order_history").authenticated);
  EXPECT_FALSE(specNamed("get_ticker").authenticated);
  EXPECT_EQ(specNamed("get_kline").path, "/v5/market/kline");
}

TEST(MarketToolSpecsTest, InputSchemaListsRequiredParams) {
  auto schema = specNamed("get_orderbook").inputSchema();

  EXPECT_EQ(schema["type"], "object");
  EXPECT_EQ(schema["required"], json::JsonValue::array({"symbol"}));
  EXPECT_EQ(schema["properties"]["limit"]["type"], "integer");
  EXPECT_EQ(schema["properties"]["limit"]["default"], "25");
  EXPECT_EQ(schema["properties"]["category"]["default"], "spot");

  auto optional_only = specNamed("get_wallet_balance").inputSchema();
  EXPECT_FALSE(optional_only.contains("required"));
}

TEST(MarketToolSpecsTest, QueryFollowsDeclarationOrderAndDefaults) {
  const auto& kline = specNamed("get_kline");

  auto query = kline.buildQuery(
      {{"symbol", "ETHUSDT"}, {"limit", 10}, {"start", nullptr}});

  QueryParams expected = {{"category", "spot"},
                          {"symbol", "ETHUSDT"},
                          {"interval", "60"},
                          {"limit", "10"}};
  EXPECT_EQ(query, expected);
}

TEST(MarketToolSpecsTest, QueryIgnoresUnknownArguments) {
  auto query = specNamed("get_ticker").buildQuery(
      {{"symbol", "BTCUSDT"}, {"category", "linear"}, {"extra", 1}});

  QueryParams expected = {{"category", "linear"}, {"symbol", "BTCUSDT"}};
  EXPECT_EQ(query, expected);
}

TEST(ArgumentToStringTest, FormatsScalars) {
  EXPECT_EQ(argumentToString("BTCUSDT"), "BTCUSDT");
  EXPECT_EQ(argumentToString(50), "50");
  EXPECT_EQ(argumentToString(true), "true");
  EXPECT_EQ(argumentToString(false), "false");
  EXPECT_EQ(argumentToString(1.5), "1.5");
}

class MarketToolTest : public ::testing::Test {
 protected:
  void SetUp() override {
    rest_ = std::make_shared<MockRestClient>();
    client_ = std::make_shared<BybitClient>(rest_, BybitClient::Config());
    executor_ = std::make_shared<InlineToolExecutor>();
  }

  std::shared_ptr<MockRestClient> rest_;
  std::shared_ptr<BybitClient> client_;
  std::shared_ptr<ToolExecutor> executor_;
};

TEST_F(MarketToolTest, ExecuteIssuesOneGet) {
  RestRequest sent;
  RestResponse response;
  response.status_code = 200;
  response.body = R"({"retCode":0,"result":{"list":[{"lastPrice":"1"}]}})";
  EXPECT_CALL(*rest_, get(_))
      .WillOnce(DoAll(SaveArg<0>(&sent), Return(response)));

  MarketTool tool(specNamed("get_ticker"), client_, executor_);
  optional<gateway::ToolResult> result;
  tool.execute({{"symbol", "BTCUSDT"}},
               [&result](gateway::ToolResult r) { result = std::move(r); });

  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(isSuccess(*result));
  EXPECT_EQ(get<json::JsonValue>(*result)["list"][0]["lastPrice"], "1");
  EXPECT_EQ(sent.url,
            "https://api.bybit.com/v5/market/tickers"
            "?category=spot&symbol=BTCUSDT");
}

TEST_F(MarketToolTest, PrivateToolWithoutCredentialsFails) {
  EXPECT_CALL(*rest_, get(_)).Times(0);

  MarketTool tool(specNamed("get_positions"), client_, executor_);
  optional<gateway::ToolResult> result;
  tool.execute(json::JsonValue::object(),
               [&result](gateway::ToolResult r) { result = std::move(r); });

  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(isError(*result));
  EXPECT_EQ(getError(*result).code, jsonrpc::TOOL_ERROR);
}

TEST_F(MarketToolTest, RegisterAddsEveryTool) {
  gateway::ToolRegistry::Builder builder;
  registerMarketTools(builder, client_, executor_);
  auto registry = builder.build();

  ASSERT_EQ(registry->size(), 9u);
  const auto* ticker = registry->resolve("get_ticker");
  ASSERT_NE(ticker, nullptr);
  EXPECT_EQ(ticker->input_schema["required"][0], "symbol");
  EXPECT_TRUE(isError(ticker->validate(json::JsonValue::object())));
  EXPECT_TRUE(isError(ticker->validate({{"symbol", 7}})));
  EXPECT_TRUE(isSuccess(ticker->validate({{"symbol", "BTCUSDT"}})));
}

}  // namespace
}  // namespace tools
}  // namespace toolgate
