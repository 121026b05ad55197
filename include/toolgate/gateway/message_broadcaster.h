#ifndef TOOLGATE_GATEWAY_MESSAGE_BROADCASTER_H
#define TOOLGATE_GATEWAY_MESSAGE_BROADCASTER_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>

#include "toolgate/gateway/connection_registry.h"
#include "toolgate/json/envelope.h"

namespace toolgate {
namespace gateway {

/**
 * @brief Fan-out of envelopes to every open connection
 *
 * While no connection is open, messages are queued and handed to the next
 * connection that opens (drain-once: the first connection consumes the
 * queue). A failed write removes the connection from the registry and is
 * never reported to the sender.
 *
 * Dispatcher thread only.
 */
class MessageBroadcaster {
 public:
  struct Config {
    // 0 = unbounded. When a cap is set and reached, the oldest entry is
    // dropped.
    size_t max_pending_messages{0};
    // 0 = entries never expire
    std::chrono::milliseconds pending_ttl{0};
  };

  struct Stats {
    std::atomic<uint64_t> messages_sent{0};
    std::atomic<uint64_t> messages_buffered{0};
    std::atomic<uint64_t> messages_dropped{0};
    std::atomic<uint64_t> messages_expired{0};
    std::atomic<uint64_t> write_failures{0};
  };

  using Clock = std::function<std::chrono::steady_clock::time_point()>;
  // Invoked after a failed write removed the connection
  using WriteFailureCb = std::function<void(const std::string& connection_id)>;

  explicit MessageBroadcaster(ConnectionRegistry& registry);
  MessageBroadcaster(ConnectionRegistry& registry, const Config& config);
  MessageBroadcaster(ConnectionRegistry& registry,
                     const Config& config,
                     Clock clock);

  /**
   * Broadcast a payload. Payloads that are not already envelopes are
   * wrapped as notifications/message with the given level.
   */
  void send(const json::JsonValue& payload, const std::string& level = "info");

  void send(const json::Envelope& envelope);

  /**
   * Write one envelope to one connection. On failure the connection is
   * removed from the registry and the write-failure callback runs.
   *
   * @return true when the channel accepted the envelope
   */
  bool writeTo(const ConnectionSharedPtr& connection,
               const json::Envelope& envelope);

  /**
   * Deliver queued messages to a newly opened connection, in order,
   * stopping at the first failed write.
   *
   * @return number of messages delivered
   */
  size_t onConnectionOpened(const ConnectionSharedPtr& connection);

  void setWriteFailureCallback(WriteFailureCb cb) {
    write_failure_cb_ = std::move(cb);
  }

  size_t pendingCount() const { return pending_.size(); }
  const Stats& stats() const { return stats_; }
  const Config& config() const { return config_; }

 private:
  struct PendingMessage {
    json::Envelope envelope;
    std::chrono::steady_clock::time_point enqueued_at;
  };

  void enqueue(const json::Envelope& envelope);
  void discardExpired();

  ConnectionRegistry& registry_;
  Config config_;
  Clock clock_;
  WriteFailureCb write_failure_cb_;
  std::deque<PendingMessage> pending_;
  Stats stats_;
};

}  // namespace gateway
}  // namespace toolgate

#endif  // TOOLGATE_GATEWAY_MESSAGE_BROADCASTER_H
