/**
 * @file tcp_transport.h
 * @brief Non-blocking stream socket transport on the event loop
 */

#ifndef MQTT_TRANSPORT_TCP_TRANSPORT_H
#define MQTT_TRANSPORT_TCP_TRANSPORT_H

#include <cstdint>
#include <memory>
#include <string>

#include "mqtt/event/event_loop.h"
#include "mqtt/transport/transport.h"

namespace mqtt {
namespace transport {

/**
 * Owns a connected stream socket (TCP or a socketpair end). Reads are
 * delivered through TransportCallbacks::onData; writes that would block are
 * buffered and flushed when the socket becomes writable.
 */
class TcpTransport : public Transport {
 public:
  // Takes ownership of `fd` and switches it to non-blocking mode
  TcpTransport(event::Dispatcher& dispatcher, int fd);
  ~TcpTransport() override;

  /**
   * Blocking connect to host:port, then hand the socket to the event loop.
   */
  static Result<TransportPtr> connect(event::Dispatcher& dispatcher,
                                      const std::string& host,
                                      uint16_t port);

  // Transport
  void setTransportCallbacks(TransportCallbacks& callbacks) override;
  VoidResult write(Buffer& data) override;
  void close() override;
  bool isOpen() const override { return fd_ >= 0; }

  int fd() const { return fd_; }
  size_t pendingWriteBytes() const { return write_buffer_.length(); }

 private:
  void onFileEvent(uint32_t events);
  void doRead();
  // Returns false when the socket failed and was closed. With
  // `defer_close` the owner hears about the close from a posted callback.
  bool doWrite(bool defer_close);
  void updateEvents();
  void closeSocket(ConnectionEvent event, bool defer_notify = false);

  event::Dispatcher& dispatcher_;
  int fd_;
  event::FileEventPtr file_event_;
  TransportCallbacks* callbacks_{nullptr};
  OwnedBuffer read_buffer_;
  OwnedBuffer write_buffer_;
  uint32_t enabled_events_{0};

  // Expires with the transport so a posted close notification is dropped
  std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
};

}  // namespace transport
}  // namespace mqtt

#endif  // MQTT_TRANSPORT_TCP_TRANSPORT_H
