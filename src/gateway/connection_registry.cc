#define TOOLGATE_LOG_COMPONENT "gateway.registry"

#include "toolgate/gateway/connection_registry.h"

#include <fmt/format.h>

#include "toolgate/logging/log_macros.h"

namespace toolgate {
namespace gateway {

std::string generateUuidV4(std::mt19937_64& random) {
  uint64_t hi = random();
  uint64_t lo = random();

  // Version 4, variant 10xx
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                     static_cast<uint32_t>(hi >> 32),
                     static_cast<uint32_t>((hi >> 16) & 0xFFFF),
                     static_cast<uint32_t>(hi & 0xFFFF),
                     static_cast<uint32_t>(lo >> 48),
                     lo & 0xFFFFFFFFFFFFULL);
}

ConnectionRegistry::ConnectionRegistry()
    : random_(std::random_device{}()) {}

ConnectionRegistry::ConnectionRegistry(IdGenerator id_generator)
    : id_generator_(std::move(id_generator)),
      random_(std::random_device{}()) {}

std::string ConnectionRegistry::generateId() {
  // A collision with a live id is retried, never reused
  for (;;) {
    std::string id = id_generator_ ? id_generator_() : generateUuidV4(random_);
    if (index_.find(id) == index_.end()) {
      return id;
    }
    TOOLGATE_LOG(Warning, "Connection id collision on {}, regenerating", id);
  }
}

std::string ConnectionRegistry::registerConnection(
    OutputChannelSharedPtr channel) {
  auto connection = std::make_shared<Connection>();
  connection->id = generateId();
  connection->channel = std::move(channel);
  connection->created_at = std::chrono::system_clock::now();
  connection->last_write = connection->created_at;

  uint64_t sequence = next_sequence_++;
  connections_[sequence] = connection;
  index_[connection->id] = sequence;

  TOOLGATE_LOG(Debug, "Registered connection {} ({} open)", connection->id,
               connections_.size());
  return connection->id;
}

bool ConnectionRegistry::remove(const std::string& id) {
  auto it = index_.find(id);
  if (it == index_.end()) {
    return false;
  }
  connections_.erase(it->second);
  index_.erase(it);

  TOOLGATE_LOG(Debug, "Removed connection {} ({} open)", id,
               connections_.size());
  return true;
}

ConnectionSharedPtr ConnectionRegistry::find(const std::string& id) const {
  auto it = index_.find(id);
  if (it == index_.end()) {
    return nullptr;
  }
  return connections_.at(it->second);
}

bool ConnectionRegistry::contains(const std::string& id) const {
  return index_.find(id) != index_.end();
}

std::vector<ConnectionSharedPtr> ConnectionRegistry::listOpen() const {
  std::vector<ConnectionSharedPtr> snapshot;
  snapshot.reserve(connections_.size());
  for (const auto& entry : connections_) {
    snapshot.push_back(entry.second);
  }
  return snapshot;
}

void ConnectionRegistry::markWritten(const std::string& id) {
  auto connection = find(id);
  if (connection) {
    connection->last_write = std::chrono::system_clock::now();
  }
}

}  // namespace gateway
}  // namespace toolgate
