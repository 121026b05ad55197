#include <regex>
#include <set>

#include <gtest/gtest.h>

#include "mocks/gateway_mocks.h"
#include "toolgate/gateway/connection_registry.h"

namespace toolgate {
namespace gateway {
namespace {

using test::FakeChannel;

TEST(ConnectionRegistryTest, RegisterAssignsUuid) {
  ConnectionRegistry registry;
  std::string id = registry.registerConnection(std::make_shared<FakeChannel>());

  std::regex uuid(
      "[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}");
  EXPECT_TRUE(std::regex_match(id, uuid)) << id;
  EXPECT_TRUE(registry.contains(id));
  EXPECT_EQ(registry.size(), 1u);
}

TEST(ConnectionRegistryTest, IdsAreUnique) {
  ConnectionRegistry registry;
  std::set<std::string> ids;
  for (int i = 0; i < 100; ++i) {
    ids.insert(registry.registerConnection(std::make_shared<FakeChannel>()));
  }
  EXPECT_EQ(ids.size(), 100u);
}

TEST(ConnectionRegistryTest, CollidingIdIsRegenerated) {
  std::vector<std::string> script = {"a", "a", "b"};
  size_t next = 0;
  ConnectionRegistry registry([&]() { return script[next++]; });

  EXPECT_EQ(registry.registerConnection(std::make_shared<FakeChannel>()), "a");
  EXPECT_EQ(registry.registerConnection(std::make_shared<FakeChannel>()), "b");
  EXPECT_EQ(next, 3u);
}

TEST(ConnectionRegistryTest, RemoveReportsWhetherPresent) {
  ConnectionRegistry registry;
  std::string id = registry.registerConnection(std::make_shared<FakeChannel>());

  EXPECT_TRUE(registry.remove(id));
  EXPECT_FALSE(registry.remove(id));
  EXPECT_FALSE(registry.contains(id));
  EXPECT_EQ(registry.find(id), nullptr);
  EXPECT_TRUE(registry.empty());
}

TEST(ConnectionRegistryTest, ListOpenIsInsertionOrderedSnapshot) {
  int n = 0;
  ConnectionRegistry registry([&]() { return "c" + std::to_string(n++); });
  registry.registerConnection(std::make_shared<FakeChannel>());
  registry.registerConnection(std::make_shared<FakeChannel>());
  registry.registerConnection(std::make_shared<FakeChannel>());
  registry.remove("c1");

  auto snapshot = registry.listOpen();
  ASSERT_EQ(snapshot.size(), 2u);
  EXPECT_EQ(snapshot[0]->id, "c0");
  EXPECT_EQ(snapshot[1]->id, "c2");

  registry.remove("c0");
  EXPECT_EQ(snapshot.size(), 2u);
  EXPECT_EQ(snapshot[0]->id, "c0");
}

TEST(ConnectionRegistryTest, FindReturnsChannel) {
  ConnectionRegistry registry;
  auto channel = std::make_shared<FakeChannel>();
  std::string id = registry.registerConnection(channel);

  auto connection = registry.find(id);
  ASSERT_NE(connection, nullptr);
  EXPECT_EQ(connection->channel, channel);
  EXPECT_EQ(connection->id, id);
}

TEST(ConnectionRegistryTest, MarkWrittenAdvancesLastWrite) {
  ConnectionRegistry registry;
  std::string id = registry.registerConnection(std::make_shared<FakeChannel>());
  auto connection = registry.find(id);
  auto before = connection->last_write;

  registry.markWritten(id);
  registry.markWritten("unknown");

  EXPECT_GE(connection->last_write, before);
}

TEST(GenerateUuidTest, SetsVersionAndVariant) {
  std::mt19937_64 random(42);
  for (int i = 0; i < 20; ++i) {
    std::string id = generateUuidV4(random);
    ASSERT_EQ(id.size(), 36u);
    EXPECT_EQ(id[14], '4');
    EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
  }
}

}  // namespace
}  // namespace gateway
}  // namespace toolgate
