#ifndef TOOLGATE_SERVER_TCP_LISTENER_H
#define TOOLGATE_SERVER_TCP_LISTENER_H

#include <cstdint>
#include <functional>
#include <string>

#include "toolgate/core/result.h"
#include "toolgate/event/event_loop.h"

namespace toolgate {
namespace server {

/**
 * @brief Non-blocking listening socket driven by the dispatcher
 *
 * Accepted sockets are handed over already non-blocking; the callback owns
 * the descriptor.
 */
class TcpListener {
 public:
  using AcceptCb = std::function<void(int fd, const std::string& peer)>;

  struct Config {
    std::string host{"0.0.0.0"};
    // 0 picks an ephemeral port, see port()
    uint16_t port{3000};
    int backlog{128};
  };

  TcpListener(event::Dispatcher& dispatcher, const Config& config, AcceptCb cb);
  ~TcpListener();

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  // Bind, listen and start accepting
  VoidResult listen();

  void disable();
  void enable();

  // Bound port, valid after a successful listen()
  uint16_t port() const { return bound_port_; }
  uint64_t acceptedCount() const { return accepted_; }

 private:
  void onSocketEvent(uint32_t events);
  void doAccept();

  event::Dispatcher& dispatcher_;
  Config config_;
  AcceptCb accept_cb_;
  int fd_{-1};
  uint16_t bound_port_{0};
  event::FileEventPtr file_event_;
  bool enabled_{true};
  uint64_t accepted_{0};
};

}  // namespace server
}  // namespace toolgate

#endif  // TOOLGATE_SERVER_TCP_LISTENER_H
