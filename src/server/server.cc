#define MQTT_LOG_COMPONENT "server"

#include "mqtt/server/server.h"

#include <utility>
#include <vector>

#include "mqtt/logging/log_macros.h"
#include "mqtt/transport/tcp_transport.h"

namespace mqtt {
namespace server {

Server::Server(event::Dispatcher& dispatcher,
               const config::ServerConfig& config)
    : dispatcher_(dispatcher),
      config_(config),
      alive_(std::make_shared<bool>(true)) {
  config_.validate();
}

Server::~Server() {
  alive_.reset();
  shutdown();
}

void Server::setConnectHandler(protocol::ConnectHandler handler) {
  handlers_.connect = std::move(handler);
}

void Server::setPublishHandler(protocol::PublishHandler handler) {
  handlers_.session.publish = std::move(handler);
}

void Server::setSubscribeHandler(protocol::SubscribeHandler handler) {
  handlers_.session.subscribe = std::move(handler);
}

void Server::setUnsubscribeHandler(protocol::UnsubscribeHandler handler) {
  handlers_.session.unsubscribe = std::move(handler);
}

void Server::setDisconnectHandler(DisconnectHandler handler) {
  handlers_.disconnect = std::move(handler);
}

ConnectionConfig Server::connectionConfig() const {
  ConnectionConfig config;
  config.max_frame_size = config_.max_frame_size;
  config.max_inflight = config_.max_inflight;
  config.handshake_timeout = config_.handshake_timeout;
  config.keep_alive_tick = config_.keep_alive_tick;
  config.default_idle_timeout = config_.default_idle_timeout;
  return config;
}

void Server::listen() {
  listener_ = std::make_unique<transport::TcpListener>(
      dispatcher_, config_.address, config_.port,
      [this](int fd) { onAccept(fd); });
  MQTT_LOG(Info, "MQTT server listening on {}:{}", config_.address,
           listener_->port());
}

uint16_t Server::port() const { return listener_ ? listener_->port() : 0; }

void Server::onAccept(int fd) {
  addConnection(
      transport::TransportPtr(new transport::TcpTransport(dispatcher_, fd)));
}

ServerConnectionSharedPtr Server::addConnection(
    transport::TransportPtr transport) {
  uint64_t id = next_connection_id_++;
  auto connection = ServerConnection::create(
      dispatcher_, std::move(transport), handlers_, connectionConfig(), id);

  std::weak_ptr<bool> alive = alive_;
  connection->setClosedCallback([this, alive](ServerConnection& closed) {
    uint64_t closed_id = closed.id();
    // Removal is deferred: the connection is still on the call stack
    dispatcher_.post([this, alive, closed_id]() {
      if (!alive.expired()) {
        onConnectionClosed(closed_id);
      }
    });
  });

  connections_[id] = connection;
  MQTT_LOG(Debug, "Connection {} accepted ({} active)", id,
           connections_.size());
  connection->start();
  return connection;
}

void Server::onConnectionClosed(uint64_t id) {
  connections_.erase(id);
  MQTT_LOG(Debug, "Connection {} removed ({} active)", id,
           connections_.size());
}

void Server::shutdown() {
  if (listener_) {
    listener_->close();
    listener_.reset();
  }

  std::vector<ServerConnectionSharedPtr> connections;
  for (auto& entry : connections_) {
    connections.push_back(entry.second);
  }
  connections_.clear();

  for (auto& connection : connections) {
    connection->close(nullopt);
  }
  if (!connections.empty()) {
    MQTT_LOG(Info, "Closed {} connections on shutdown", connections.size());
  }
}

}  // namespace server
}  // namespace mqtt
