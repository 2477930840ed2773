/**
 * @file tcp_listener.h
 * @brief Listening TCP socket that hands accepted fds to a callback
 */

#ifndef MQTT_TRANSPORT_TCP_LISTENER_H
#define MQTT_TRANSPORT_TCP_LISTENER_H

#include <cstdint>
#include <functional>
#include <string>

#include "mqtt/event/event_loop.h"

namespace mqtt {
namespace transport {

class TcpListener {
 public:
  // Receives ownership of the accepted socket
  using AcceptCallback = std::function<void(int fd)>;

  /**
   * Bind and listen on address:port. Port 0 picks an ephemeral port.
   * Throws std::runtime_error if the socket cannot be bound.
   */
  TcpListener(event::Dispatcher& dispatcher,
              const std::string& address,
              uint16_t port,
              AcceptCallback on_accept,
              int backlog = 128);
  ~TcpListener();

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  // Actual bound port
  uint16_t port() const { return port_; }
  const std::string& address() const { return address_; }

  void close();

 private:
  void onAccept();

  event::Dispatcher& dispatcher_;
  std::string address_;
  uint16_t port_;
  AcceptCallback on_accept_;
  int fd_{-1};
  event::FileEventPtr file_event_;
};

}  // namespace transport
}  // namespace mqtt

#endif  // MQTT_TRANSPORT_TCP_LISTENER_H
