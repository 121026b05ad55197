#include <gtest/gtest.h>

#include "toolgate/tools/request_signer.h"

namespace toolgate {
namespace tools {
namespace {

TEST(HmacSha256Test, KnownVector) {
  EXPECT_EQ(hmacSha256Hex("key", "The quick brown fox jumps over the lazy dog"),
            "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");
}

TEST(HmacSha256Test, EmptyInputs) {
  EXPECT_EQ(hmacSha256Hex("", ""),
            "b613679a0814d9ec772f95d778c35fc5ff1697c493715653c6c712144292c5ad");
}

TEST(RequestSignerTest, SignsTimestampKeyWindowAndQuery) {
  RequestSigner signer("my-key", "my-secret", 5000);

  EXPECT_EQ(signer.signature(1700000000000, "category=spot&symbol=BTCUSDT"),
            hmacSha256Hex("my-secret",
                          "1700000000000my-key5000category=spot&symbol=BTCUSDT"));
}

TEST(RequestSignerTest, HeadersCarryCredentialsAndSignature) {
  RequestSigner signer("my-key", "my-secret", 10000);
  auto headers = signer.sign(1234, "coin=USDT");

  EXPECT_EQ(headers.at("X-BAPI-API-KEY"), "my-key");
  EXPECT_EQ(headers.at("X-BAPI-TIMESTAMP"), "1234");
  EXPECT_EQ(headers.at("X-BAPI-RECV-WINDOW"), "10000");
  EXPECT_EQ(headers.at("X-BAPI-SIGN"), signer.signature(1234, "coin=USDT"));
  EXPECT_EQ(headers.at("X-BAPI-SIGN").size(), 64u);
}

TEST(RequestSignerTest, QueryChangesSignature) {
  RequestSigner signer("k", "s");
  EXPECT_NE(signer.signature(1, "a=1"), signer.signature(1, "a=2"));
  EXPECT_NE(signer.signature(1, "a=1"), signer.signature(2, "a=1"));
}

}  // namespace
}  // namespace tools
}  // namespace toolgate
