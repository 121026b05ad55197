#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "toolgate/logging/log_formatter.h"
#include "toolgate/logging/log_level.h"

using namespace toolgate::logging;

class LogFormatterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    message_.level = LogLevel::Warning;
    message_.message = "write failed";
    message_.logger_name = "gateway.broadcaster";
    message_.connection_id = "abc";
  }

  LogMessage message_;
};

TEST_F(LogFormatterTest, DefaultFormatIncludesLevelLoggerAndContext) {
  DefaultFormatter formatter;
  std::string line = formatter.format(message_);

  EXPECT_NE(line.find("[WARNING]"), std::string::npos);
  EXPECT_NE(line.find("[gateway.broadcaster]"), std::string::npos);
  EXPECT_NE(line.find("[conn:abc]"), std::string::npos);
  EXPECT_NE(line.find("write failed"), std::string::npos);
}

TEST_F(LogFormatterTest, DefaultFormatAppendsKeyValues) {
  message_.key_values["attempt"] = "2";
  DefaultFormatter formatter;

  EXPECT_NE(formatter.format(message_).find("{attempt=2}"), std::string::npos);
}

TEST_F(LogFormatterTest, JsonFormatIsOneObject) {
  message_.component = Component::Gateway;
  JsonFormatter formatter;
  std::string line = formatter.format(message_);

  EXPECT_EQ(line.find('\n'), std::string::npos);
  auto j = nlohmann::json::parse(line);
  EXPECT_EQ(j["level"], "WARNING");
  EXPECT_EQ(j["logger"], "gateway.broadcaster");
  EXPECT_EQ(j["component"], "Gateway");
  EXPECT_EQ(j["connection_id"], "abc");
  EXPECT_EQ(j["message"], "write failed");
}

TEST_F(LogFormatterTest, JsonFormatSurvivesInvalidUtf8) {
  message_.message = std::string("bad \xff byte");
  JsonFormatter formatter;

  EXPECT_NO_THROW(nlohmann::json::parse(formatter.format(message_)));
}

TEST(CreateFormatterTest, KnownNames) {
  EXPECT_NE(createFormatter("text"), nullptr);
  EXPECT_NE(createFormatter("json"), nullptr);
  EXPECT_EQ(createFormatter("xml"), nullptr);
}

TEST(LogLevelTest, StringConversion) {
  EXPECT_EQ(stringToLogLevel("debug"), LogLevel::Debug);
  EXPECT_EQ(stringToLogLevel("warn"), LogLevel::Warning);
  EXPECT_EQ(stringToLogLevel("bogus"), LogLevel::Info);
  EXPECT_TRUE(isKnownLogLevel("info"));
  EXPECT_FALSE(isKnownLogLevel("bogus"));
  EXPECT_STREQ(logLevelToString(LogLevel::Critical), "CRITICAL");
}
