#ifndef TOOLGATE_GATEWAY_OUTPUT_CHANNEL_H
#define TOOLGATE_GATEWAY_OUTPUT_CHANNEL_H

#include <memory>

#include "toolgate/core/result.h"
#include "toolgate/json/envelope.h"

namespace toolgate {
namespace gateway {

/**
 * @brief Sink for envelopes pushed to one streaming client
 *
 * Implemented by the SSE transport and by test doubles. A failed write
 * means the client is gone; the gateway never retries it.
 */
class OutputChannel {
 public:
  virtual ~OutputChannel() = default;

  /**
   * Hand one complete envelope to the transport. Must not block.
   */
  virtual VoidResult write(const json::Envelope& envelope) = 0;

  /**
   * Release the underlying transport. Called exactly once by the gateway.
   */
  virtual void close() = 0;
};

using OutputChannelSharedPtr = std::shared_ptr<OutputChannel>;

}  // namespace gateway
}  // namespace toolgate

#endif  // TOOLGATE_GATEWAY_OUTPUT_CHANNEL_H
