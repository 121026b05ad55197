#ifndef TOOLGATE_SERVER_SSE_CHANNEL_H
#define TOOLGATE_SERVER_SSE_CHANNEL_H

#include <memory>

#include "toolgate/gateway/output_channel.h"
#include "toolgate/server/http_connection.h"

namespace toolgate {
namespace server {

/**
 * @brief OutputChannel writing one "data:" frame per envelope to an HTTP
 * stream
 *
 * Holds the socket weakly; writes fail once the socket is gone.
 */
class SseChannel : public gateway::OutputChannel {
 public:
  explicit SseChannel(std::weak_ptr<HttpConnection> connection)
      : connection_(std::move(connection)) {}

  VoidResult write(const json::Envelope& envelope) override;
  void close() override;

 private:
  std::weak_ptr<HttpConnection> connection_;
};

}  // namespace server
}  // namespace toolgate

#endif  // TOOLGATE_SERVER_SSE_CHANNEL_H
