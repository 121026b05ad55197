#ifndef TOOLGATE_GATEWAY_CONNECTION_REGISTRY_H
#define TOOLGATE_GATEWAY_CONNECTION_REGISTRY_H

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "toolgate/gateway/output_channel.h"

namespace toolgate {
namespace gateway {

/**
 * @brief One open streaming client
 */
struct Connection {
  std::string id;
  OutputChannelSharedPtr channel;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point last_write;
};

using ConnectionSharedPtr = std::shared_ptr<Connection>;

/**
 * @brief Tracks open streaming connections by identifier
 *
 * Owned and mutated on the dispatcher thread only. listOpen() returns a
 * snapshot so callers may register or remove while iterating it.
 */
class ConnectionRegistry {
 public:
  using IdGenerator = std::function<std::string()>;

  ConnectionRegistry();
  // Deterministic ids for tests
  explicit ConnectionRegistry(IdGenerator id_generator);

  /**
   * Store a new connection for the channel and return its fresh id.
   */
  std::string registerConnection(OutputChannelSharedPtr channel);

  /**
   * Remove the connection. Returns false if it was not registered.
   */
  bool remove(const std::string& id);

  ConnectionSharedPtr find(const std::string& id) const;
  bool contains(const std::string& id) const;

  std::vector<ConnectionSharedPtr> listOpen() const;

  void markWritten(const std::string& id);

  size_t size() const { return connections_.size(); }
  bool empty() const { return connections_.empty(); }

 private:
  std::string generateId();

  IdGenerator id_generator_;
  std::mt19937_64 random_;
  // Ordered by insertion sequence so broadcasts are deterministic
  std::map<uint64_t, ConnectionSharedPtr> connections_;
  std::map<std::string, uint64_t> index_;
  uint64_t next_sequence_{0};
};

// Random RFC 4122 version 4 UUID in 8-4-4-4-12 hex form
std::string generateUuidV4(std::mt19937_64& random);

}  // namespace gateway
}  // namespace toolgate

#endif  // TOOLGATE_GATEWAY_CONNECTION_REGISTRY_H
