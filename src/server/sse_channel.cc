#include "toolgate/server/sse_channel.h"

#include "toolgate/http/sse_event.h"

namespace toolgate {
namespace server {

VoidResult SseChannel::write(const json::Envelope& envelope) {
  auto connection = connection_.lock();
  if (!connection || !connection->isOpen()) {
    return makeVoidError(Error(-1, "Connection is gone"));
  }
  return connection->writeStream(
      http::SseEventBuilder(envelope.serialize()).serialize());
}

void SseChannel::close() {
  auto connection = connection_.lock();
  if (connection) {
    connection->close();
  }
}

}  // namespace server
}  // namespace toolgate
