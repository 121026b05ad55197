#ifndef TOOLGATE_GATEWAY_HEARTBEAT_SCHEDULER_H
#define TOOLGATE_GATEWAY_HEARTBEAT_SCHEDULER_H

#include <chrono>
#include <cstdint>
#include <string>

#include "toolgate/event/event_loop.h"
#include "toolgate/gateway/connection_registry.h"
#include "toolgate/gateway/message_broadcaster.h"

namespace toolgate {
namespace gateway {

constexpr std::chrono::milliseconds kDefaultHeartbeatInterval{30000};

/**
 * @brief Periodic keep-alive for a single connection
 *
 * Each tick writes a heartbeat notification through
 * MessageBroadcaster::writeTo. The scheduler stops for good when its
 * connection has left the registry or a write fails.
 *
 * Must be destroyed on the dispatcher thread, and never from inside its own
 * tick.
 */
class HeartbeatScheduler {
 public:
  HeartbeatScheduler(event::Dispatcher& dispatcher,
                     ConnectionRegistry& registry,
                     MessageBroadcaster& broadcaster,
                     const std::string& connection_id,
                     std::chrono::milliseconds interval =
                         kDefaultHeartbeatInterval);
  ~HeartbeatScheduler();

  HeartbeatScheduler(const HeartbeatScheduler&) = delete;
  HeartbeatScheduler& operator=(const HeartbeatScheduler&) = delete;

  void start();
  void cancel();

  bool active() const { return active_; }
  uint64_t beatsSent() const { return beats_sent_; }
  const std::string& connectionId() const { return connection_id_; }

 private:
  void onTick();

  ConnectionRegistry& registry_;
  MessageBroadcaster& broadcaster_;
  std::string connection_id_;
  std::chrono::milliseconds interval_;
  event::TimerPtr timer_;
  bool active_{false};
  bool cancelled_{false};
  uint64_t beats_sent_{0};
};

// {"jsonrpc":"2.0","method":"heartbeat","params":{"timestamp":<ms>}}
json::Envelope makeHeartbeat(int64_t timestamp_ms);

}  // namespace gateway
}  // namespace toolgate

#endif  // TOOLGATE_GATEWAY_HEARTBEAT_SCHEDULER_H
