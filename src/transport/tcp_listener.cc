#define MQTT_LOG_COMPONENT "transport.listener"

#include "mqtt/transport/tcp_listener.h"

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>
#include <stdexcept>
#include <utility>

#include "mqtt/logging/log_macros.h"

namespace mqtt {
namespace transport {

TcpListener::TcpListener(event::Dispatcher& dispatcher,
                         const std::string& address,
                         uint16_t port,
                         AcceptCallback on_accept,
                         int backlog)
    : dispatcher_(dispatcher),
      address_(address),
      port_(port),
      on_accept_(std::move(on_accept)) {
  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
    throw std::runtime_error("Invalid listen address: " + address);
  }

  fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
  if (fd_ < 0) {
    throw std::runtime_error(std::string("Failed to create socket: ") +
                             std::strerror(errno));
  }

  int one = 1;
  (void)::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
      ::listen(fd_, backlog) != 0) {
    std::string reason = std::strerror(errno);
    ::close(fd_);
    fd_ = -1;
    throw std::runtime_error("Failed to listen on " + address + ":" +
                             std::to_string(port) + ": " + reason);
  }

  sockaddr_in bound;
  socklen_t len = sizeof(bound);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
    port_ = ntohs(bound.sin_port);
  }

  file_event_ = dispatcher_.createFileEvent(
      fd_, [this](uint32_t) { onAccept(); },
      static_cast<uint32_t>(event::FileReadyType::Read));

  MQTT_LOG(Info, "Listening on {}:{}", address_, port_);
}

TcpListener::~TcpListener() { close(); }

void TcpListener::close() {
  if (fd_ < 0) {
    return;
  }
  file_event_.reset();
  ::close(fd_);
  fd_ = -1;
  MQTT_LOG(Debug, "Listener on {}:{} closed", address_, port_);
}

void TcpListener::onAccept() {
  while (fd_ >= 0) {
    sockaddr_in peer;
    socklen_t len = sizeof(peer);
    int fd = ::accept4(fd_, reinterpret_cast<sockaddr*>(&peer), &len,
                       SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno != EAGAIN && errno != EWOULDBLOCK) {
        MQTT_LOG(Warning, "accept failed: {}", std::strerror(errno));
      }
      return;
    }

    char peer_addr[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &peer.sin_addr, peer_addr, sizeof(peer_addr));
    MQTT_LOG(Debug, "Accepted fd {} from {}:{}", fd, peer_addr,
             ntohs(peer.sin_port));
    on_accept_(fd);
  }
}

}  // namespace transport
}  // namespace mqtt
