#define TOOLGATE_LOG_COMPONENT "transport.listener"

#include "toolgate/server/tcp_listener.h"

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>

#include <fmt/format.h>

#include "toolgate/logging/log_macros.h"

namespace toolgate {
namespace server {

namespace {

bool setNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    return false;
  }
  return fcntl(fd, F_SETFD, FD_CLOEXEC) == 0;
}

std::string peerToString(const sockaddr_storage& addr) {
  char host[INET6_ADDRSTRLEN] = {0};
  uint16_t port = 0;
  if (addr.ss_family == AF_INET) {
    const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
    inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
    port = ntohs(in->sin_port);
  } else if (addr.ss_family == AF_INET6) {
    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
    inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
    port = ntohs(in6->sin6_port);
  }
  return fmt::format("{}:{}", host, port);
}

VoidResult socketError(const std::string& what) {
  return makeVoidError(
      Error(errno, fmt::format("{}: {}", what, std::strerror(errno))));
}

}  // namespace

TcpListener::TcpListener(event::Dispatcher& dispatcher,
                         const Config& config,
                         AcceptCb cb)
    : dispatcher_(dispatcher), config_(config), accept_cb_(std::move(cb)) {}

TcpListener::~TcpListener() {
  file_event_.reset();
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

VoidResult TcpListener::listen() {
  addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

  std::string port = std::to_string(config_.port);
  addrinfo* results = nullptr;
  int rc = getaddrinfo(config_.host.empty() ? nullptr : config_.host.c_str(),
                       port.c_str(), &hints, &results);
  if (rc != 0) {
    return makeVoidError(Error(rc, fmt::format("Cannot resolve {}: {}",
                                               config_.host,
                                               gai_strerror(rc))));
  }

  VoidResult result = makeVoidError(Error(-1, "No usable address"));
  for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      result = socketError("socket");
      continue;
    }

    int val = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &val, sizeof(val));

    if (!setNonBlocking(fd)) {
      result = socketError("fcntl");
      ::close(fd);
      continue;
    }
    if (::bind(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
      result = socketError(
          fmt::format("bind {}:{}", config_.host, config_.port));
      ::close(fd);
      continue;
    }
    if (::listen(fd, config_.backlog) != 0) {
      result = socketError("listen");
      ::close(fd);
      continue;
    }

    fd_ = fd;
    result = makeVoidSuccess();
    break;
  }
  freeaddrinfo(results);

  if (isError(result)) {
    TOOLGATE_LOG(Error, "Listener setup failed: {}",
                 getError(result).message);
    return result;
  }

  sockaddr_storage local;
  socklen_t local_len = sizeof(local);
  if (getsockname(fd_, reinterpret_cast<sockaddr*>(&local), &local_len) == 0) {
    if (local.ss_family == AF_INET) {
      bound_port_ = ntohs(reinterpret_cast<sockaddr_in*>(&local)->sin_port);
    } else if (local.ss_family == AF_INET6) {
      bound_port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&local)->sin6_port);
    }
  }

  file_event_ = dispatcher_.createFileEvent(
      fd_, [this](uint32_t events) { onSocketEvent(events); },
      event::FileTriggerType::Level,
      enabled_ ? static_cast<uint32_t>(event::FileReadyType::Read) : 0);

  TOOLGATE_LOG(Info, "Listening on {}:{}", config_.host, bound_port_);
  return makeVoidSuccess();
}

void TcpListener::disable() {
  enabled_ = false;
  if (file_event_) {
    file_event_->setEnabled(0);
  }
}

void TcpListener::enable() {
  enabled_ = true;
  if (file_event_) {
    file_event_->setEnabled(static_cast<uint32_t>(event::FileReadyType::Read));
  }
}

void TcpListener::onSocketEvent(uint32_t events) {
  if (events & static_cast<uint32_t>(event::FileReadyType::Read)) {
    doAccept();
  }
}

void TcpListener::doAccept() {
  // Accept everything that is queued
  while (true) {
    sockaddr_storage addr;
    socklen_t addr_len = sizeof(addr);
    int fd = ::accept(fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len);

    if (fd < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        break;
      }
      if (errno == EINTR || errno == ECONNABORTED) {
        continue;
      }
      if (errno == EMFILE || errno == ENFILE) {
        TOOLGATE_LOG(Error, "Out of file descriptors, accept deferred");
        break;
      }
      TOOLGATE_LOG(Warning, "accept failed: {}", std::strerror(errno));
      break;
    }

    if (!setNonBlocking(fd)) {
      TOOLGATE_LOG(Warning, "Could not make accepted socket non-blocking");
      ::close(fd);
      continue;
    }

    accepted_++;
    accept_cb_(fd, peerToString(addr));
  }
}

}  // namespace server
}  // namespace toolgate
