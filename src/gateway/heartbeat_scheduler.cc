#define TOOLGATE_LOG_COMPONENT "gateway.heartbeat"

#include "toolgate/gateway/heartbeat_scheduler.h"

#include "toolgate/logging/log_macros.h"

namespace toolgate {
namespace gateway {

json::Envelope makeHeartbeat(int64_t timestamp_ms) {
  return json::makeNotification(json::METHOD_HEARTBEAT,
                                json::JsonValue{{"timestamp", timestamp_ms}});
}

HeartbeatScheduler::HeartbeatScheduler(event::Dispatcher& dispatcher,
                                       ConnectionRegistry& registry,
                                       MessageBroadcaster& broadcaster,
                                       const std::string& connection_id,
                                       std::chrono::milliseconds interval)
    : registry_(registry),
      broadcaster_(broadcaster),
      connection_id_(connection_id),
      interval_(interval) {
  timer_ = dispatcher.createTimer([this]() { onTick(); });
}

HeartbeatScheduler::~HeartbeatScheduler() {
  if (timer_) {
    timer_->disableTimer();
  }
}

void HeartbeatScheduler::start() {
  // A cancelled scheduler stays cancelled
  if (cancelled_ || active_) {
    return;
  }
  active_ = true;
  timer_->enableTimer(interval_);
}

void HeartbeatScheduler::cancel() {
  if (cancelled_) {
    return;
  }
  cancelled_ = true;
  active_ = false;
  timer_->disableTimer();
  TOOLGATE_LOG(Debug, "Heartbeat cancelled for {} after {} beat(s)",
               connection_id_, beats_sent_);
}

void HeartbeatScheduler::onTick() {
  if (!active_) {
    return;
  }

  auto connection = registry_.find(connection_id_);
  if (!connection) {
    cancel();
    return;
  }

  auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now().time_since_epoch())
                    .count();

  if (!broadcaster_.writeTo(connection, makeHeartbeat(now_ms))) {
    // writeTo already removed the connection
    cancel();
    return;
  }

  beats_sent_++;
  timer_->enableTimer(interval_);
}

}  // namespace gateway
}  // namespace toolgate
