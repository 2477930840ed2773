/**
 * @file connection.h
 * @brief Server side of one MQTT connection
 *
 * Lifecycle:
 *   Handshaking: bytes are decoded until CONNECT arrives, then decoding
 *     pauses while the connect handler runs
 *   Established: CONNACK sent, packets routed through ProtocolDispatcher,
 *     keep-alive armed
 *   Closed: every exit path (DISCONNECT, refusal, protocol error, timeout,
 *     handler failure, peer close) goes through close() exactly once
 */

#ifndef MQTT_SERVER_CONNECTION_H
#define MQTT_SERVER_CONNECTION_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include "mqtt/buffer.h"
#include "mqtt/codec/frame_decoder.h"
#include "mqtt/core/result.h"
#include "mqtt/event/event_loop.h"
#include "mqtt/logging/log_message.h"
#include "mqtt/protocol/handlers.h"
#include "mqtt/protocol/handshake_state_machine.h"
#include "mqtt/protocol/keep_alive_monitor.h"
#include "mqtt/protocol/protocol_dispatcher.h"
#include "mqtt/session/session.h"
#include "mqtt/transport/transport.h"

namespace mqtt {
namespace server {

// Invoked once for every connection that got past CONNECT. `error` is true
// unless the peer sent DISCONNECT or the application closed the session.
using DisconnectHandler =
    std::function<void(const session::SessionSharedPtr& session, bool error)>;

struct ConnectionConfig {
  // Largest accepted remaining length, 0 for the protocol maximum
  uint32_t max_frame_size{0};
  size_t max_inflight{protocol::DEFAULT_MAX_INFLIGHT};
  // 0 disables the handshake timeout
  std::chrono::milliseconds handshake_timeout{0};
  std::chrono::milliseconds keep_alive_tick{protocol::DEFAULT_KEEP_ALIVE_TICK};
  // Replaces the client's keep-alive when non-zero, unless the connect
  // handler sets its own idle timeout
  std::chrono::milliseconds default_idle_timeout{0};
};

struct ConnectionHandlers {
  protocol::ConnectHandler connect;
  protocol::SessionHandlers session;
  DisconnectHandler disconnect;
};

class ServerConnection;
using ServerConnectionSharedPtr = std::shared_ptr<ServerConnection>;

class ServerConnection
    : public transport::TransportCallbacks,
      public std::enable_shared_from_this<ServerConnection> {
 public:
  // Owner notification after close; the owner releases its reference
  using ClosedCallback = std::function<void(ServerConnection&)>;

  static ServerConnectionSharedPtr create(event::Dispatcher& dispatcher,
                                          transport::TransportPtr transport,
                                          ConnectionHandlers handlers,
                                          ConnectionConfig config,
                                          uint64_t id = 0);

  ~ServerConnection() override;

  ServerConnection(const ServerConnection&) = delete;
  ServerConnection& operator=(const ServerConnection&) = delete;

  // Registers with the transport and arms the handshake timeout
  void start();

  /**
   * Close the connection. nullopt is a normal close, an Error a fatal one.
   * Pending outbound publishes fail, late handler completions are dropped.
   */
  void close(const optional<Error>& error = nullopt);

  void setClosedCallback(ClosedCallback cb) { closed_cb_ = std::move(cb); }

  uint64_t id() const { return id_; }
  bool closed() const { return closed_; }
  bool established() const { return protocol_ != nullptr; }
  const session::SessionSharedPtr& session() const { return session_; }
  protocol::HandshakeState handshakeState() const {
    return handshake_->currentState();
  }
  const protocol::KeepAliveMonitor& keepAlive() const { return keep_alive_; }
  const protocol::ProtocolDispatcher* protocolDispatcher() const {
    return protocol_.get();
  }

  // TransportCallbacks
  void onData(Buffer& data) override;
  void onClose(transport::ConnectionEvent event) override;

 private:
  ServerConnection(event::Dispatcher& dispatcher,
                   transport::TransportPtr transport,
                   ConnectionHandlers handlers,
                   ConnectionConfig config,
                   uint64_t id);

  void processReadBuffer();
  void onAccepted(const codec::Connect& connect,
                  const protocol::ConnectResponse& response);
  void onRejected(const protocol::ConnectResponse& response);

  std::chrono::milliseconds idleInterval(
      const codec::Connect& connect,
      const protocol::ConnectResponse& response) const;

  // Encode and write; failures close the connection from a posted callback
  void sendPacket(const codec::Packet& packet);
  void deferClose(const optional<Error>& error);

  session::Sink::PacketWriter makeWriter();
  session::Sink::CloseRequest makeCloseRequest();

  event::Dispatcher& dispatcher_;
  transport::TransportPtr transport_;
  ConnectionHandlers handlers_;
  ConnectionConfig config_;
  uint64_t id_;
  logging::LogContext log_context_;

  OwnedBuffer read_buffer_;
  codec::FrameDecoder decoder_;
  std::unique_ptr<protocol::HandshakeStateMachine> handshake_;
  protocol::KeepAliveMonitor keep_alive_;

  session::SinkSharedPtr sink_;
  session::SessionSharedPtr session_;
  std::unique_ptr<protocol::ProtocolDispatcher> protocol_;

  ClosedCallback closed_cb_;
  bool processing_{false};
  bool closed_{false};

  // Outbound frames posted from other threads and not yet written
  std::shared_ptr<std::atomic<size_t>> posted_writes_;
};

}  // namespace server
}  // namespace mqtt

#endif  // MQTT_SERVER_CONNECTION_H
