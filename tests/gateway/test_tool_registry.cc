#include <stdexcept>

#include <gtest/gtest.h>

#include "mocks/gateway_mocks.h"
#include "toolgate/gateway/tool_registry.h"

namespace toolgate {
namespace gateway {
namespace {

std::shared_ptr<FunctionTool> echoTool() {
  return std::make_shared<FunctionTool>(
      [](const json::JsonValue& args) { return args; });
}

json::JsonValue symbolSchema() {
  return json::JsonValue::parse(R"({
    "type": "object",
    "properties": {
      "symbol": {"type": "string"},
      "limit": {"type": "integer"},
      "price": {"type": ["number", "string"]}
    },
    "required": ["symbol"]
  })");
}

TEST(ToolRegistryTest, ResolvesRegisteredTools) {
  ToolRegistry::Builder builder;
  builder.registerTool("get_ticker", "Ticker", symbolSchema(), echoTool())
      .registerTool("ping_tool", "Ping", json::JsonValue(), echoTool());
  auto registry = builder.build();

  ASSERT_EQ(registry->size(), 2u);
  ASSERT_NE(registry->resolve("get_ticker"), nullptr);
  EXPECT_EQ(registry->resolve("get_ticker")->description, "Ticker");
  EXPECT_EQ(registry->resolve("missing"), nullptr);
}

TEST(ToolRegistryTest, ListKeepsInsertionOrder) {
  ToolRegistry::Builder builder;
  builder.registerTool("zeta", "", json::JsonValue(), echoTool());
  builder.registerTool("alpha", "", json::JsonValue(), echoTool());
  auto registry = builder.build();

  ASSERT_EQ(registry->list().size(), 2u);
  EXPECT_EQ(registry->list()[0].name, "zeta");
  EXPECT_EQ(registry->list()[1].name, "alpha");
}

TEST(ToolRegistryTest, DuplicateNameThrows) {
  ToolRegistry::Builder builder;
  builder.registerTool("get_ticker", "", json::JsonValue(), echoTool());

  EXPECT_THROW(
      builder.registerTool("get_ticker", "", json::JsonValue(), echoTool()),
      ConfigurationError);
}

TEST(ToolRegistryTest, EmptyNameOrMissingCapabilityThrows) {
  ToolRegistry::Builder builder;
  EXPECT_THROW(builder.registerTool("", "", json::JsonValue(), echoTool()),
               ConfigurationError);
  EXPECT_THROW(builder.registerTool("x", "", json::JsonValue(), nullptr),
               ConfigurationError);
}

TEST(ToolRegistryTest, DescriptorJsonDefaultsSchema) {
  ToolDescriptor descriptor;
  descriptor.name = "t";
  descriptor.description = "desc";
  descriptor.capability = echoTool();

  auto j = descriptor.toJson();
  EXPECT_EQ(j["name"], "t");
  EXPECT_EQ(j["description"], "desc");
  EXPECT_EQ(j["inputSchema"]["type"], "object");
}

TEST(SchemaValidationTest, AcceptsMatchingArguments) {
  EXPECT_TRUE(isSuccess(validateAgainstSchema(
      symbolSchema(), {{"symbol", "BTCUSDT"}, {"limit", 5}})));
  EXPECT_TRUE(isSuccess(validateAgainstSchema(
      symbolSchema(), {{"symbol", "BTCUSDT"}, {"price", "1.5"}})));
}

TEST(SchemaValidationTest, MissingRequiredArgument) {
  auto result = validateAgainstSchema(symbolSchema(), {{"limit", 5}});

  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).code, jsonrpc::TOOL_ERROR);
  EXPECT_EQ(getError(result).message, "Missing required argument: symbol");
}

TEST(SchemaValidationTest, WrongPropertyType) {
  auto result = validateAgainstSchema(symbolSchema(),
                                      {{"symbol", "BTCUSDT"}, {"limit", "5"}});

  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).message, "Invalid type for argument: limit");
  EXPECT_TRUE(isError(validateAgainstSchema(
      symbolSchema(), {{"symbol", "BTCUSDT"}, {"price", true}})));
}

TEST(SchemaValidationTest, ArgumentsMustBeObject) {
  EXPECT_TRUE(
      isError(validateAgainstSchema(symbolSchema(), json::JsonValue::array())));
}

TEST(SchemaValidationTest, NoSchemaAcceptsAnything) {
  EXPECT_TRUE(isSuccess(validateAgainstSchema(json::JsonValue(), 42)));
}

class RejectingTool : public ToolCapability {
 public:
  VoidResult validate(const json::JsonValue& arguments) const override {
    if (arguments.value("limit", 0) > 100) {
      return makeVoidError(Error(jsonrpc::TOOL_ERROR, "limit too large"));
    }
    return makeVoidSuccess();
  }

  void execute(const json::JsonValue&, ToolCallback callback) override {
    callback(makeSuccess(json::JsonValue::object()));
  }
};

TEST(ToolDescriptorTest, CapabilityValidationRunsAfterSchema) {
  ToolDescriptor descriptor;
  descriptor.name = "t";
  descriptor.input_schema = symbolSchema();
  descriptor.capability = std::make_shared<RejectingTool>();

  EXPECT_TRUE(isSuccess(descriptor.validate({{"symbol", "A"}, {"limit", 5}})));

  auto too_big = descriptor.validate({{"symbol", "A"}, {"limit", 500}});
  ASSERT_TRUE(isError(too_big));
  EXPECT_EQ(getError(too_big).message, "limit too large");

  auto schema_first = descriptor.validate({{"limit", 500}});
  ASSERT_TRUE(isError(schema_first));
  EXPECT_EQ(getError(schema_first).message,
            "Missing required argument: symbol");
}

TEST(FunctionToolTest, ExceptionBecomesToolError) {
  FunctionTool tool([](const json::JsonValue&) -> json::JsonValue {
    throw std::runtime_error("exchange offline");
  });

  optional<ToolResult> result;
  tool.execute(json::JsonValue::object(),
               [&result](ToolResult r) { result = std::move(r); });

  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(isError(*result));
  EXPECT_EQ(getError(*result).code, jsonrpc::TOOL_ERROR);
  EXPECT_EQ(getError(*result).message, "exchange offline");
}

}  // namespace
}  // namespace gateway
}  // namespace toolgate
