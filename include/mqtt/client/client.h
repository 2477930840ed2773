/**
 * @file client.h
 * @brief MQTT client connection
 *
 * The client sends CONNECT, waits for CONNACK and then serves the session
 * with the same ProtocolDispatcher the server uses: inbound PUBLISH goes to
 * the publish handler and is acknowledged, outbound publishes go through the
 * session sink.
 *
 * Usage:
 *   auto client = client::ClientBuilder("sensor-1")
 *                     .keepAlive(60)
 *                     .publishHandler(on_publish)
 *                     .build(*dispatcher);
 *   client->connect("127.0.0.1", 1883, [](Result<client::ConnectResult> r) {
 *     ...
 *   });
 */

#ifndef MQTT_CLIENT_CLIENT_H
#define MQTT_CLIENT_CLIENT_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "mqtt/buffer.h"
#include "mqtt/codec/frame_decoder.h"
#include "mqtt/codec/packet.h"
#include "mqtt/core/result.h"
#include "mqtt/event/event_loop.h"
#include "mqtt/logging/log_message.h"
#include "mqtt/protocol/handlers.h"
#include "mqtt/protocol/protocol_dispatcher.h"
#include "mqtt/session/session.h"
#include "mqtt/transport/transport.h"

namespace mqtt {
namespace client {

enum class ClientState {
  Idle,        // not connected yet
  Connecting,  // CONNECT sent, waiting for CONNACK
  Connected,   // session established
  Closed       // terminal
};

const char* clientStateToString(ClientState state);

struct ClientOptions {
  std::string client_id;
  bool clean_session{true};
  // Seconds, 0 disables pings
  uint16_t keep_alive{30};
  optional<codec::LastWill> last_will;
  optional<std::string> username;
  optional<codec::Bytes> password;
  size_t inflight{protocol::DEFAULT_MAX_INFLIGHT};
  // Time allowed for CONNACK, 0 disables
  std::chrono::milliseconds handshake_timeout{0};
  uint32_t max_frame_size{0};
};

using DisconnectHandler =
    std::function<void(const session::SessionSharedPtr& session, bool error)>;

struct ClientHandlers {
  protocol::SessionHandlers session;
  DisconnectHandler disconnect;
};

struct ConnectResult {
  bool session_present{false};
  session::SessionSharedPtr session;
};

// Called once: with the session on acceptance, or with an Error when the
// server refused (CONNECTION_REFUSED), timed out or the transport failed
using ConnectCallback = std::function<void(Result<ConnectResult>)>;

class Client;
using ClientSharedPtr = std::shared_ptr<Client>;

class Client : public transport::TransportCallbacks,
               public std::enable_shared_from_this<Client> {
 public:
  static ClientSharedPtr create(event::Dispatcher& dispatcher,
                                ClientOptions options,
                                ClientHandlers handlers);

  ~Client() override;

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  /**
   * Run the handshake over a connected transport.
   */
  void connect(transport::TransportPtr transport, ConnectCallback callback);

  /**
   * Open a TCP connection to host:port, then run the handshake.
   */
  void connect(const std::string& host,
               uint16_t port,
               ConnectCallback callback);

  // Send DISCONNECT and close
  void disconnect();

  void close(const optional<Error>& error = nullopt);

  ClientState state() const { return state_; }
  const ClientOptions& options() const { return options_; }
  const session::SessionSharedPtr& session() const { return session_; }
  // Return code of the received CONNACK
  const optional<codec::ConnectCode>& connectCode() const {
    return connect_code_;
  }

  codec::Connect connectPacket() const;

  // TransportCallbacks
  void onData(Buffer& data) override;
  void onClose(transport::ConnectionEvent event) override;

 private:
  Client(event::Dispatcher& dispatcher,
         ClientOptions options,
         ClientHandlers handlers);

  void processReadBuffer();
  void onConnectAck(const codec::Packet& packet);
  void onHandshakeTimeout();
  void onPingTimer();
  void completeConnect(Result<ConnectResult> result);

  void sendPacket(const codec::Packet& packet);
  void deferClose(const optional<Error>& error);
  session::Sink::PacketWriter makeWriter();
  session::Sink::CloseRequest makeCloseRequest();

  event::Dispatcher& dispatcher_;
  ClientOptions options_;
  ClientHandlers handlers_;
  ClientState state_{ClientState::Idle};
  logging::LogContext log_context_;

  transport::TransportPtr transport_;
  OwnedBuffer read_buffer_;
  codec::FrameDecoder decoder_;
  ConnectCallback connect_cb_;
  optional<codec::ConnectCode> connect_code_;

  event::TimerPtr handshake_timer_;
  event::TimerPtr ping_timer_;

  session::SinkSharedPtr sink_;
  session::SessionSharedPtr session_;
  std::unique_ptr<protocol::ProtocolDispatcher> protocol_;

  bool processing_{false};
  std::shared_ptr<std::atomic<size_t>> posted_writes_;
};

/**
 * Fluent construction of a client.
 */
class ClientBuilder {
 public:
  explicit ClientBuilder(std::string client_id);

  ClientBuilder& cleanSession(bool value);
  ClientBuilder& keepAlive(uint16_t seconds);
  ClientBuilder& lastWill(codec::LastWill will);
  ClientBuilder& username(std::string value);
  ClientBuilder& password(codec::Bytes value);
  ClientBuilder& inflight(size_t value);
  ClientBuilder& handshakeTimeout(std::chrono::milliseconds timeout);
  ClientBuilder& maxFrameSize(uint32_t value);

  ClientBuilder& publishHandler(protocol::PublishHandler handler);
  ClientBuilder& subscribeHandler(protocol::SubscribeHandler handler);
  ClientBuilder& unsubscribeHandler(protocol::UnsubscribeHandler handler);
  ClientBuilder& disconnectHandler(DisconnectHandler handler);

  const ClientOptions& options() const { return options_; }

  ClientSharedPtr build(event::Dispatcher& dispatcher) const;

 private:
  ClientOptions options_;
  ClientHandlers handlers_;
};

}  // namespace client
}  // namespace mqtt

#endif  // MQTT_CLIENT_CLIENT_H
