#define TOOLGATE_LOG_COMPONENT "gateway.broadcaster"

#include "toolgate/gateway/message_broadcaster.h"

#include "toolgate/logging/log_macros.h"

namespace toolgate {
namespace gateway {

namespace {

std::chrono::steady_clock::time_point steadyNow() {
  return std::chrono::steady_clock::now();
}

}  // namespace

MessageBroadcaster::MessageBroadcaster(ConnectionRegistry& registry)
    : MessageBroadcaster(registry, Config()) {}

MessageBroadcaster::MessageBroadcaster(ConnectionRegistry& registry,
                                       const Config& config)
    : MessageBroadcaster(registry, config, &steadyNow) {}

MessageBroadcaster::MessageBroadcaster(ConnectionRegistry& registry,
                                       const Config& config,
                                       Clock clock)
    : registry_(registry), config_(config), clock_(std::move(clock)) {}

void MessageBroadcaster::send(const json::JsonValue& payload,
                              const std::string& level) {
  if (json::isEnvelope(payload)) {
    auto parsed = json::parseEnvelope(payload);
    send(get<json::Envelope>(parsed));
    return;
  }
  send(json::wrapAsMessage(payload, level));
}

void MessageBroadcaster::send(const json::Envelope& envelope) {
  if (registry_.empty()) {
    enqueue(envelope);
    return;
  }

  // Snapshot: failed writes remove connections while we iterate
  auto connections = registry_.listOpen();
  for (const auto& connection : connections) {
    writeTo(connection, envelope);
  }
}

bool MessageBroadcaster::writeTo(const ConnectionSharedPtr& connection,
                                 const json::Envelope& envelope) {
  if (!connection || !connection->channel) {
    return false;
  }

  auto result = connection->channel->write(envelope);
  if (isSuccess(result)) {
    connection->last_write = std::chrono::system_clock::now();
    stats_.messages_sent++;
    return true;
  }

  stats_.write_failures++;
  TOOLGATE_LOG(Debug, "Write to connection {} failed: {}", connection->id,
               getError(result).message);

  // Only the first failure for a connection reaches the callback
  if (registry_.remove(connection->id) && write_failure_cb_) {
    write_failure_cb_(connection->id);
  }
  return false;
}

size_t MessageBroadcaster::onConnectionOpened(
    const ConnectionSharedPtr& connection) {
  discardExpired();

  size_t delivered = 0;
  while (!pending_.empty()) {
    if (!writeTo(connection, pending_.front().envelope)) {
      break;
    }
    pending_.pop_front();
    ++delivered;
  }

  if (delivered > 0) {
    TOOLGATE_LOG(Info, "Delivered {} buffered message(s) to connection {}",
                 delivered, connection->id);
  }
  if (!pending_.empty()) {
    TOOLGATE_LOG(Warning,
                 "{} buffered message(s) kept after a failed drain to {}",
                 pending_.size(), connection->id);
  }
  return delivered;
}

void MessageBroadcaster::enqueue(const json::Envelope& envelope) {
  discardExpired();

  if (config_.max_pending_messages > 0 &&
      pending_.size() >= config_.max_pending_messages) {
    pending_.pop_front();
    stats_.messages_dropped++;
    TOOLGATE_LOG(Warning,
                 "Pending queue full ({} messages), dropped the oldest",
                 config_.max_pending_messages);
  }

  pending_.push_back(PendingMessage{envelope, clock_()});
  stats_.messages_buffered++;
  TOOLGATE_LOG(Debug, "No open connections, buffered message ({} pending)",
               pending_.size());
}

void MessageBroadcaster::discardExpired() {
  if (config_.pending_ttl.count() <= 0) {
    return;
  }

  auto now = clock_();
  size_t expired = 0;
  // Entries are in arrival order, so expired ones sit at the front
  while (!pending_.empty() &&
         now - pending_.front().enqueued_at >= config_.pending_ttl) {
    pending_.pop_front();
    ++expired;
  }

  if (expired > 0) {
    stats_.messages_expired += expired;
    TOOLGATE_LOG(Info, "Discarded {} expired buffered message(s)", expired);
  }
}

}  // namespace gateway
}  // namespace toolgate
