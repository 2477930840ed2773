/**
 * @file server.h
 * @brief MQTT server: listener, handler set and live connections
 *
 * The server runs on one dispatcher. Every accepted socket becomes a
 * ServerConnection that shares the configured handlers; connections remove
 * themselves from the server when they close.
 *
 * Usage:
 *   auto dispatcher = event::createLibeventDispatcherFactory()
 *                         ->createDispatcher("mqtt");
 *   server::Server server(*dispatcher, config);
 *   server.setConnectHandler(...);
 *   server.setPublishHandler(router.handler());
 *   server.listen();
 *   dispatcher->run(event::RunType::RunUntilExit);
 */

#ifndef MQTT_SERVER_SERVER_H
#define MQTT_SERVER_SERVER_H

#include <cstdint>
#include <map>
#include <memory>

#include "mqtt/config/server_config.h"
#include "mqtt/event/event_loop.h"
#include "mqtt/protocol/handlers.h"
#include "mqtt/server/connection.h"
#include "mqtt/transport/tcp_listener.h"
#include "mqtt/transport/transport.h"

namespace mqtt {
namespace server {

class Server {
 public:
  Server(event::Dispatcher& dispatcher, const config::ServerConfig& config);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Handlers apply to connections accepted after the call
  void setConnectHandler(protocol::ConnectHandler handler);
  void setPublishHandler(protocol::PublishHandler handler);
  void setSubscribeHandler(protocol::SubscribeHandler handler);
  void setUnsubscribeHandler(protocol::UnsubscribeHandler handler);
  void setDisconnectHandler(DisconnectHandler handler);

  /**
   * Start accepting on the configured address and port.
   * @throws std::runtime_error if the socket cannot be bound
   */
  void listen();

  // Bound port once listening, 0 before
  uint16_t port() const;

  /**
   * Serve an already connected transport, for example one end of a
   * socketpair.
   */
  ServerConnectionSharedPtr addConnection(transport::TransportPtr transport);

  // Stop listening and close every connection
  void shutdown();

  size_t connectionCount() const { return connections_.size(); }
  const config::ServerConfig& config() const { return config_; }
  ConnectionConfig connectionConfig() const;

 private:
  void onAccept(int fd);
  void onConnectionClosed(uint64_t id);

  event::Dispatcher& dispatcher_;
  config::ServerConfig config_;
  ConnectionHandlers handlers_;
  std::unique_ptr<transport::TcpListener> listener_;
  std::map<uint64_t, ServerConnectionSharedPtr> connections_;
  uint64_t next_connection_id_{1};

  // Expires with this object so posted removals can detect it
  std::shared_ptr<bool> alive_;
};

}  // namespace server
}  // namespace mqtt

#endif  // MQTT_SERVER_SERVER_H
