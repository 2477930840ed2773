/**
 * @file transport.h
 * @brief Duplex byte transport consumed by the MQTT connection layer
 *
 * The protocol engine only ever writes complete frames and reads whatever
 * bytes arrived. All calls and callbacks happen on the owning dispatcher
 * thread.
 */

#ifndef MQTT_TRANSPORT_TRANSPORT_H
#define MQTT_TRANSPORT_TRANSPORT_H

#include <memory>

#include "mqtt/buffer.h"
#include "mqtt/core/result.h"

namespace mqtt {
namespace transport {

enum class ConnectionEvent {
  RemoteClose,  // peer closed or reset the stream
  LocalClose    // close() was called
};

const char* connectionEventToString(ConnectionEvent event);

class TransportCallbacks {
 public:
  virtual ~TransportCallbacks() = default;

  /**
   * Bytes arrived. The callee drains what it consumed; the remainder stays
   * in the buffer for the next delivery.
   */
  virtual void onData(Buffer& data) = 0;

  /**
   * Called once when the transport closes for any reason.
   */
  virtual void onClose(ConnectionEvent event) = 0;
};

class Transport {
 public:
  virtual ~Transport() = default;

  virtual void setTransportCallbacks(TransportCallbacks& callbacks) = 0;

  /**
   * Queue `data` for sending and drain it. Bytes already accepted are
   * delivered in order. Never calls back into TransportCallbacks: a failed
   * write is returned here and onClose follows from the event loop.
   */
  virtual VoidResult write(Buffer& data) = 0;

  /**
   * Flush what can be written without blocking, then close.
   */
  virtual void close() = 0;

  virtual bool isOpen() const = 0;
};

using TransportPtr = std::unique_ptr<Transport>;

}  // namespace transport
}  // namespace mqtt

#endif  // MQTT_TRANSPORT_TRANSPORT_H
