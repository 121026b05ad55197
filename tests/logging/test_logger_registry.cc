#include <mutex>
#include <vector>

#include <gtest/gtest.h>

#define TOOLGATE_LOG_COMPONENT "gateway.test"
#include "toolgate/logging/log_macros.h"
#include "toolgate/logging/logger_registry.h"

using namespace toolgate::logging;

// Test sink for capturing
class TestCaptureSink : public LogSink {
 public:
  void log(const LogMessage& msg) override {
    std::lock_guard<std::mutex> lock(mutex_);
    messages.push_back(msg);
  }

  void flush() override {}
  SinkType type() const override { return SinkType::Null; }

  std::vector<LogMessage> getMessages() {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages;
  }

 private:
  std::mutex mutex_;
  std::vector<LogMessage> messages;
};

class LoggerRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry_ = &LoggerRegistry::instance();
    registry_->reset();
    test_sink_ = std::make_shared<TestCaptureSink>();
    registry_->setDefaultSink(test_sink_);
  }

  void TearDown() override { registry_->reset(); }

  LoggerRegistry* registry_;
  std::shared_ptr<TestCaptureSink> test_sink_;
};

TEST_F(LoggerRegistryTest, SingletonInstance) {
  EXPECT_EQ(&LoggerRegistry::instance(), &LoggerRegistry::instance());
}

TEST_F(LoggerRegistryTest, DefaultLogger) {
  auto logger = registry_->getDefaultLogger();

  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->getName(), "default");
  EXPECT_EQ(logger->getLevel(), LogLevel::Info);
}

TEST_F(LoggerRegistryTest, GetOrCreateReturnsSameLogger) {
  auto logger1 = registry_->getOrCreateLogger("gateway.broadcaster");
  auto logger2 = registry_->getOrCreateLogger("gateway.broadcaster");

  EXPECT_EQ(logger1, logger2);
  EXPECT_EQ(logger1->getName(), "gateway.broadcaster");
}

TEST_F(LoggerRegistryTest, GlobalLevelAppliesToExistingLoggers) {
  auto logger = registry_->getOrCreateLogger("tools.bybit");
  EXPECT_FALSE(logger->shouldLog(LogLevel::Debug));

  registry_->setGlobalLevel(LogLevel::Debug);
  EXPECT_TRUE(logger->shouldLog(LogLevel::Debug));

  registry_->setGlobalLevel(LogLevel::Off);
  EXPECT_FALSE(logger->shouldLog(LogLevel::Emergency));
}

TEST_F(LoggerRegistryTest, ComponentLevelMatchesLowercasePrefix) {
  registry_->setComponentLevel(Component::Gateway, LogLevel::Error);

  EXPECT_EQ(registry_->getEffectiveLevel("gateway.heartbeat"), LogLevel::Error);
  EXPECT_EQ(registry_->getEffectiveLevel("Gateway.heartbeat"), LogLevel::Error);
  EXPECT_EQ(registry_->getEffectiveLevel("transport.http"), LogLevel::Info);
}

TEST_F(LoggerRegistryTest, LatestPatternWins) {
  registry_->setPattern("transport.*", LogLevel::Warning);
  registry_->setPattern("transport.http", LogLevel::Debug);

  EXPECT_EQ(registry_->getEffectiveLevel("transport.http"), LogLevel::Debug);
  EXPECT_EQ(registry_->getEffectiveLevel("transport.listener"),
            LogLevel::Warning);
}

TEST_F(LoggerRegistryTest, MacroRecordsComponentAndLocation) {
  TOOLGATE_LOG(Info, "opened {} of {}", 1, 2);
  TOOLGATE_LOG(Debug, "not recorded");

  auto messages = test_sink_->getMessages();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].message, "opened 1 of 2");
  EXPECT_EQ(messages[0].logger_name, "gateway.test");
  EXPECT_EQ(messages[0].level, LogLevel::Info);
  EXPECT_GT(messages[0].line, 0);
}

TEST_F(LoggerRegistryTest, ComponentLoggerNamesLogger) {
  ComponentLogger logger(Component::Tools, "market");
  logger.log(LogLevel::Warning, "rate limited for {}ms", 250);

  auto messages = test_sink_->getMessages();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].logger_name, "Tools.market");
  EXPECT_EQ(messages[0].component, Component::Tools);
  EXPECT_EQ(messages[0].message, "rate limited for 250ms");
}

TEST_F(LoggerRegistryTest, ResetRestoresDefaults) {
  registry_->setGlobalLevel(LogLevel::Error);
  registry_->getOrCreateLogger("config.file");

  registry_->reset();

  EXPECT_EQ(registry_->getGlobalLevel(), LogLevel::Info);
  auto names = registry_->getLoggerNames();
  ASSERT_EQ(names.size(), 1u);
  EXPECT_EQ(names[0], "default");
}
