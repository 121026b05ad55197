#ifndef TOOLGATE_HTTP_SSE_EVENT_H
#define TOOLGATE_HTTP_SSE_EVENT_H

#include <cstdint>
#include <string>
#include <utility>

#include "toolgate/core/compat.h"

namespace toolgate {
namespace http {

/**
 * Server-Sent Event (text/event-stream) frame
 */
struct SseEvent {
  optional<std::string> id;
  optional<std::string> event;
  optional<uint32_t> retry;
  std::string data;
};

/**
 * Serializes events in the text/event-stream wire format:
 * optional id/event/retry fields, one "data:" line per line of payload,
 * terminated by a blank line.
 */
class SseEventBuilder {
 public:
  SseEventBuilder() = default;
  explicit SseEventBuilder(std::string data) { event_.data = std::move(data); }

  SseEventBuilder& withId(const std::string& id) {
    event_.id = id;
    return *this;
  }

  SseEventBuilder& withEvent(const std::string& event) {
    event_.event = event;
    return *this;
  }

  SseEventBuilder& withRetry(uint32_t retry_ms) {
    event_.retry = retry_ms;
    return *this;
  }

  SseEventBuilder& withData(const std::string& data) {
    event_.data = data;
    return *this;
  }

  const SseEvent& build() const { return event_; }

  std::string serialize() const;

 private:
  SseEvent event_;
};

// ": <text>\n\n", ignored by clients
std::string formatSseComment(const std::string& comment);

}  // namespace http
}  // namespace toolgate

#endif  // TOOLGATE_HTTP_SSE_EVENT_H
