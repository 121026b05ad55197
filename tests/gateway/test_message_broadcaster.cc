#include <gtest/gtest.h>

#include "mocks/gateway_mocks.h"
#include "toolgate/gateway/message_broadcaster.h"

namespace toolgate {
namespace gateway {
namespace {

using test::FakeChannel;
using test::MockOutputChannel;
using ::testing::_;
using ::testing::Return;

class MessageBroadcasterTest : public ::testing::Test {
 protected:
  MessageBroadcasterTest()
      : registry_([this]() { return "conn-" + std::to_string(next_id_++); }) {}

  // Registers a fresh fake channel and returns it
  std::shared_ptr<FakeChannel> open(std::string* id_out = nullptr) {
    auto channel = std::make_shared<FakeChannel>();
    std::string id = registry_.registerConnection(channel);
    if (id_out) {
      *id_out = id;
    }
    return channel;
  }

  int next_id_{0};
  ConnectionRegistry registry_;
};

TEST_F(MessageBroadcasterTest, DeliversToEveryOpenConnection) {
  MessageBroadcaster broadcaster(registry_);
  auto a = open();
  auto b = open();

  broadcaster.send(json::makeNotification("update"));

  ASSERT_EQ(a->written.size(), 1u);
  ASSERT_EQ(b->written.size(), 1u);
  EXPECT_EQ(a->written[0].method, "update");
  EXPECT_EQ(broadcaster.stats().messages_sent.load(), 2u);
  EXPECT_EQ(broadcaster.pendingCount(), 0u);
}

TEST_F(MessageBroadcasterTest, WrapsPlainPayloads) {
  MessageBroadcaster broadcaster(registry_);
  auto channel = open();

  broadcaster.send(json::JsonValue{{"price", 100}}, "warning");

  ASSERT_EQ(channel->written.size(), 1u);
  const auto& sent = channel->written[0];
  EXPECT_EQ(sent.method, json::METHOD_MESSAGE);
  EXPECT_EQ(sent.params["message"], R"({"price":100})");
  EXPECT_EQ(sent.params["level"], "warning");
}

TEST_F(MessageBroadcasterTest, ForwardsEnvelopesUnchanged) {
  MessageBroadcaster broadcaster(registry_);
  auto channel = open();

  broadcaster.send(json::JsonValue::parse(
      R"({"jsonrpc":"2.0","method":"tick","params":{"n":1}})"));

  ASSERT_EQ(channel->written.size(), 1u);
  EXPECT_EQ(channel->written[0].method, "tick");
  EXPECT_EQ(channel->written[0].params["n"], 1);
}

TEST_F(MessageBroadcasterTest, BuffersWithoutConnectionsAndDrainsInOrder) {
  MessageBroadcaster broadcaster(registry_);
  broadcaster.send(json::makeNotification("first"));
  broadcaster.send(json::makeNotification("second"));
  EXPECT_EQ(broadcaster.pendingCount(), 2u);
  EXPECT_EQ(broadcaster.stats().messages_buffered.load(), 2u);

  std::string id;
  auto channel = open(&id);
  EXPECT_EQ(broadcaster.onConnectionOpened(registry_.find(id)), 2u);

  EXPECT_EQ(channel->methods(), (std::vector<std::string>{"first", "second"}));
  EXPECT_EQ(broadcaster.pendingCount(), 0u);
}

TEST_F(MessageBroadcasterTest, QueueIsDrainedOnlyOnce) {
  MessageBroadcaster broadcaster(registry_);
  broadcaster.send(json::makeNotification("only"));

  std::string first_id;
  auto first = open(&first_id);
  broadcaster.onConnectionOpened(registry_.find(first_id));

  std::string second_id;
  auto second = open(&second_id);
  EXPECT_EQ(broadcaster.onConnectionOpened(registry_.find(second_id)), 0u);

  EXPECT_EQ(first->written.size(), 1u);
  EXPECT_TRUE(second->written.empty());
}

TEST_F(MessageBroadcasterTest, FailedWriteRemovesOnlyThatConnection) {
  MessageBroadcaster broadcaster(registry_);
  std::string bad_id;
  auto bad = open(&bad_id);
  auto good = open();
  bad->failWrites();

  std::vector<std::string> failures;
  broadcaster.setWriteFailureCallback(
      [&failures](const std::string& id) { failures.push_back(id); });

  broadcaster.send(json::makeNotification("one"));
  broadcaster.send(json::makeNotification("two"));

  EXPECT_FALSE(registry_.contains(bad_id));
  EXPECT_EQ(registry_.size(), 1u);
  EXPECT_EQ(good->written.size(), 2u);
  EXPECT_EQ(bad->failed_writes, 1);
  EXPECT_EQ(failures, (std::vector<std::string>{bad_id}));
  EXPECT_EQ(broadcaster.stats().write_failures.load(), 1u);
}

TEST_F(MessageBroadcasterTest, LastConnectionFailingRestartsBuffering) {
  MessageBroadcaster broadcaster(registry_);
  auto channel = open();
  channel->failWrites();

  broadcaster.send(json::makeNotification("lost"));
  EXPECT_TRUE(registry_.empty());
  EXPECT_EQ(broadcaster.pendingCount(), 0u);

  broadcaster.send(json::makeNotification("kept"));
  EXPECT_EQ(broadcaster.pendingCount(), 1u);
}

TEST_F(MessageBroadcasterTest, DrainStopsAtFirstFailure) {
  MessageBroadcaster broadcaster(registry_);
  broadcaster.send(json::makeNotification("a"));
  broadcaster.send(json::makeNotification("b"));
  broadcaster.send(json::makeNotification("c"));

  std::string id;
  auto channel = open(&id);
  channel->failAfter(1);

  EXPECT_EQ(broadcaster.onConnectionOpened(registry_.find(id)), 1u);
  EXPECT_EQ(channel->methods(), (std::vector<std::string>{"a"}));
  EXPECT_EQ(broadcaster.pendingCount(), 2u);
  EXPECT_FALSE(registry_.contains(id));
}

TEST_F(MessageBroadcasterTest, DefaultQueueKeepsEveryMessage) {
  MessageBroadcaster broadcaster(registry_);
  for (int i = 0; i < 1500; ++i) {
    broadcaster.send(json::JsonValue{{"n", i}});
  }
  EXPECT_EQ(broadcaster.pendingCount(), 1500u);
  EXPECT_EQ(broadcaster.stats().messages_dropped.load(), 0u);

  std::string id;
  auto channel = open(&id);
  EXPECT_EQ(broadcaster.onConnectionOpened(registry_.find(id)), 1500u);

  ASSERT_EQ(channel->written.size(), 1500u);
  EXPECT_EQ(channel->written.front().params["message"], R"({"n":0})");
  EXPECT_EQ(channel->written.back().params["message"], R"({"n":1499})");
  EXPECT_EQ(broadcaster.pendingCount(), 0u);
}

TEST_F(MessageBroadcasterTest, ConfiguredCapDropsOldest) {
  MessageBroadcaster::Config config;
  config.max_pending_messages = 2;
  MessageBroadcaster broadcaster(registry_, config);

  broadcaster.send(json::makeNotification("1"));
  broadcaster.send(json::makeNotification("2"));
  broadcaster.send(json::makeNotification("3"));

  EXPECT_EQ(broadcaster.pendingCount(), 2u);
  EXPECT_EQ(broadcaster.stats().messages_dropped.load(), 1u);

  std::string id;
  auto channel = open(&id);
  broadcaster.onConnectionOpened(registry_.find(id));
  EXPECT_EQ(channel->methods(), (std::vector<std::string>{"2", "3"}));
}

TEST_F(MessageBroadcasterTest, ExpiredEntriesAreDiscarded) {
  auto now = std::chrono::steady_clock::time_point();
  MessageBroadcaster::Config config;
  config.pending_ttl = std::chrono::milliseconds(100);
  MessageBroadcaster broadcaster(registry_, config, [&now]() { return now; });

  broadcaster.send(json::makeNotification("old"));
  now += std::chrono::milliseconds(60);
  broadcaster.send(json::makeNotification("new"));
  now += std::chrono::milliseconds(60);

  std::string id;
  auto channel = open(&id);
  EXPECT_EQ(broadcaster.onConnectionOpened(registry_.find(id)), 1u);
  EXPECT_EQ(channel->methods(), (std::vector<std::string>{"new"}));
  EXPECT_EQ(broadcaster.stats().messages_expired.load(), 1u);
}

TEST_F(MessageBroadcasterTest, MockChannelSeesEnvelope) {
  MessageBroadcaster broadcaster(registry_);
  auto channel = std::make_shared<MockOutputChannel>();
  registry_.registerConnection(channel);

  EXPECT_CALL(*channel, write(::testing::Field(&json::Envelope::method,
                                               "notice")))
      .WillOnce(Return(makeVoidSuccess()));
  EXPECT_CALL(*channel, close()).Times(0);

  broadcaster.send(json::makeNotification("notice"));
}

}  // namespace
}  // namespace gateway
}  // namespace toolgate
