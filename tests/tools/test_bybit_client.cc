#include <gtest/gtest.h>

#include "mocks/gateway_mocks.h"
#include "toolgate/tools/bybit_client.h"

namespace toolgate {
namespace tools {
namespace {

using test::MockRestClient;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SaveArg;

RestResponse reply(int status, const std::string& body) {
  RestResponse response;
  response.status_code = status;
  response.body = body;
  return response;
}

class BybitClientTest : public ::testing::Test {
 protected:
  void SetUp() override { rest_ = std::make_shared<MockRestClient>(); }

  std::unique_ptr<BybitClient> makeClient(bool with_credentials,
                                          bool testnet = false) {
    BybitClient::Config config;
    config.testnet = testnet;
    config.timeout = std::chrono::seconds(3);
    if (with_credentials) {
      config.api_key = "key";
      config.api_secret = "secret";
    }
    return std::unique_ptr<BybitClient>(
        new BybitClient(rest_, config, []() -> int64_t { return 1000; }));
  }

  std::shared_ptr<MockRestClient> rest_;
};

TEST(QueryStringTest, EncodesReservedCharacters) {
  EXPECT_EQ(percentEncode("BTC/USDT 1"), "BTC%2FUSDT%201");
  EXPECT_EQ(percentEncode("a-b_c.d~e"), "a-b_c.d~e");
  EXPECT_EQ(buildQueryString({{"category", "spot"}, {"symbol", "BTCUSDT"}}),
            "category=spot&symbol=BTCUSDT");
  EXPECT_EQ(buildQueryString({}), "");
}

TEST_F(BybitClientTest, ReturnsResultMember) {
  RestRequest sent;
  EXPECT_CALL(*rest_, get(_))
      .WillOnce(DoAll(SaveArg<0>(&sent),
                      Return(reply(200, R"({"retCode":0,"retMsg":"OK",)"
                                        R"("result":{"list":[1,2]}})"))));

  auto client = makeClient(false);
  auto result = client->get("/v5/market/tickers",
                            {{"category", "spot"}, {"symbol", "BTCUSDT"}},
                            false);

  ASSERT_TRUE(isSuccess(result));
  EXPECT_EQ(get<json::JsonValue>(result)["list"].size(), 2u);
  EXPECT_EQ(sent.url,
            "https://api.bybit.com/v5/market/tickers"
            "?category=spot&symbol=BTCUSDT");
  EXPECT_EQ(sent.timeout, std::chrono::seconds(3));
  EXPECT_EQ(sent.headers.count("X-BAPI-SIGN"), 0u);
}

TEST_F(BybitClientTest, TestnetUsesTestnetHost) {
  auto client = makeClient(false, true);
  EXPECT_EQ(client->baseUrl(), kBybitTestnetUrl);
}

TEST_F(BybitClientTest, AuthenticatedCallWithoutCredentialsFailsFast) {
  EXPECT_CALL(*rest_, get(_)).Times(0);

  auto client = makeClient(false);
  auto result = client->get("/v5/account/wallet-balance", {}, true);

  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).code, jsonrpc::TOOL_ERROR);
  EXPECT_NE(getError(result).message.find("BYBIT_API_KEY"), std::string::npos);
}

TEST_F(BybitClientTest, AuthenticatedCallIsSigned) {
  RestRequest sent;
  EXPECT_CALL(*rest_, get(_))
      .WillOnce(DoAll(SaveArg<0>(&sent),
                      Return(reply(200, R"({"retCode":0,"result":{}})"))));

  auto client = makeClient(true);
  auto result =
      client->get("/v5/account/wallet-balance", {{"accountType", "UNIFIED"}},
                  true);

  ASSERT_TRUE(isSuccess(result));
  RequestSigner signer("key", "secret", 5000);
  EXPECT_EQ(sent.headers.at("X-BAPI-API-KEY"), "key");
  EXPECT_EQ(sent.headers.at("X-BAPI-TIMESTAMP"), "1000");
  EXPECT_EQ(sent.headers.at("X-BAPI-SIGN"),
            signer.signature(1000, "accountType=UNIFIED"));
}

TEST_F(BybitClientTest, TransportErrorIsToolError) {
  RestResponse failed;
  failed.error = "Couldn't resolve host name";
  EXPECT_CALL(*rest_, get(_)).WillOnce(Return(failed));

  auto result = makeClient(false)->get("/v5/market/tickers", {}, false);

  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).message,
            "Request to /v5/market/tickers failed: Couldn't resolve host name");
}

TEST_F(BybitClientTest, HttpErrorIncludesRetMsg) {
  EXPECT_CALL(*rest_, get(_))
      .WillOnce(Return(reply(403, R"({"retCode":10003,"retMsg":"Invalid key"})")))
      .WillOnce(Return(reply(502, "<html>bad gateway</html>")));

  auto client = makeClient(false);
  auto with_detail = client->get("/v5/market/kline", {}, false);
  ASSERT_TRUE(isError(with_detail));
  EXPECT_EQ(getError(with_detail).message,
            "HTTP 403 from /v5/market/kline: Invalid key");

  auto without_detail = client->get("/v5/market/kline", {}, false);
  ASSERT_TRUE(isError(without_detail));
  EXPECT_EQ(getError(without_detail).message, "HTTP 502 from /v5/market/kline");
}

TEST_F(BybitClientTest, UnparsableBodyIsToolError) {
  EXPECT_CALL(*rest_, get(_)).WillOnce(Return(reply(200, "not json")));

  auto result = makeClient(false)->get("/v5/market/tickers", {}, false);

  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).message, "Invalid response from /v5/market/tickers");
}

TEST_F(BybitClientTest, NonZeroRetCodeIsToolError) {
  EXPECT_CALL(*rest_, get(_))
      .WillOnce(Return(
          reply(200, R"({"retCode":10001,"retMsg":"params error","result":{}})")));

  auto result = makeClient(false)->get("/v5/market/tickers", {}, false);

  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).code, jsonrpc::TOOL_ERROR);
  EXPECT_EQ(getError(result).message, "Bybit error 10001: params error");
}

TEST_F(BybitClientTest, MissingResultYieldsEmptyObject) {
  EXPECT_CALL(*rest_, get(_)).WillOnce(Return(reply(200, R"({"retCode":0})")));

  auto result = makeClient(false)->get("/v5/market/time", {}, false);

  ASSERT_TRUE(isSuccess(result));
  EXPECT_EQ(get<json::JsonValue>(result), json::JsonValue::object());
}

}  // namespace
}  // namespace tools
}  // namespace toolgate
