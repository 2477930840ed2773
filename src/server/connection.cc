#define MQTT_LOG_COMPONENT "server.connection"

#include "mqtt/server/connection.h"

#include <exception>
#include <utility>

#include "mqtt/logging/log_macros.h"

namespace mqtt {
namespace server {

ServerConnectionSharedPtr ServerConnection::create(
    event::Dispatcher& dispatcher,
    transport::TransportPtr transport,
    ConnectionHandlers handlers,
    ConnectionConfig config,
    uint64_t id) {
  return ServerConnectionSharedPtr(
      new ServerConnection(dispatcher, std::move(transport),
                           std::move(handlers), config, id));
}

ServerConnection::ServerConnection(event::Dispatcher& dispatcher,
                                   transport::TransportPtr transport,
                                   ConnectionHandlers handlers,
                                   ConnectionConfig config,
                                   uint64_t id)
    : dispatcher_(dispatcher),
      transport_(std::move(transport)),
      handlers_(std::move(handlers)),
      config_(config),
      id_(id),
      decoder_(config.max_frame_size),
      keep_alive_(
          dispatcher,
          [this](const Error& error) { close(error); },
          config.keep_alive_tick),
      posted_writes_(std::make_shared<std::atomic<size_t>>(0)) {
  log_context_.connection_id = id_;
  protocol::HandshakeConfig hs;
  hs.timeout = config_.handshake_timeout;
  hs.connect_handler = handlers_.connect;
  hs.on_accepted = [this](const codec::Connect& connect,
                          const protocol::ConnectResponse& response) {
    onAccepted(connect, response);
  };
  hs.on_rejected = [this](const protocol::ConnectResponse& response) {
    onRejected(response);
  };
  hs.on_failed = [this](const Error& error) { close(error); };
  handshake_ = std::make_unique<protocol::HandshakeStateMachine>(
      dispatcher_, std::move(hs));
}

ServerConnection::~ServerConnection() {
  closed_cb_ = nullptr;
  if (!closed_) {
    close(Error(errors::DISCONNECTED, "Connection destroyed"));
  }
}

void ServerConnection::start() {
  MQTT_CONN_LOG(Debug, log_context_, "Connection started");
  transport_->setTransportCallbacks(*this);
  handshake_->start();
}

// ===== Inbound =====

void ServerConnection::onData(Buffer& data) {
  if (closed_) {
    data.drain(data.length());
    return;
  }
  data.move(read_buffer_);
  processReadBuffer();
}

void ServerConnection::processReadBuffer() {
  if (processing_) {
    return;
  }
  processing_ = true;

  while (!closed_ && read_buffer_.length() > 0) {
    // Hold further input until the connect handler answers
    if (handshake_->currentState() ==
        protocol::HandshakeState::Authenticating) {
      break;
    }

    auto result = decoder_.decode(read_buffer_);
    if (isError(result)) {
      const Error& error = get<Error>(result);
      MQTT_CONN_LOG(Warning, log_context_, "Decode error: {}",
                    error.message);
      processing_ = false;
      close(error);
      return;
    }

    auto& packet = get<optional<codec::Packet>>(result);
    if (!packet) {
      break;
    }

    keep_alive_.onFrameReceived();
    if (protocol_) {
      protocol_->onPacket(std::move(*packet));
    } else {
      handshake_->onPacket(std::move(*packet));
    }
  }

  processing_ = false;
}

void ServerConnection::onClose(transport::ConnectionEvent event) {
  if (closed_) {
    return;
  }
  MQTT_CONN_LOG(Debug, log_context_, "Transport closed: {}",
                transport::connectionEventToString(event));
  close(Error(errors::DISCONNECTED, "Connection closed by peer"));
}

// ===== Handshake outcome =====

void ServerConnection::onAccepted(const codec::Connect& connect,
                                  const protocol::ConnectResponse& response) {
  if (closed_) {
    return;
  }

  sink_ = std::make_shared<session::Sink>(makeWriter(), makeCloseRequest());
  session_ = std::make_shared<session::Session>(
      connect.client_id, connect.username, sink_, response.state());

  sendPacket(codec::Packet(response.toPacket()));

  protocol::ProtocolDispatcherConfig pd;
  pd.max_inflight = response.inflight() ? *response.inflight()
                                        : config_.max_inflight;
  pd.send_packet = [this](codec::Packet packet) { sendPacket(packet); };
  pd.close = [this](const optional<Error>& error) { close(error); };
  protocol_ = std::make_unique<protocol::ProtocolDispatcher>(
      dispatcher_, session_, handlers_.session, std::move(pd));

  keep_alive_.start(idleInterval(connect, response));

  log_context_.client_id = connect.client_id;
  MQTT_CONN_LOG(Info, log_context_, "Client connected (keep_alive={}s)",
                connect.keep_alive);

  // Resume bytes that arrived while the connect handler ran
  if (read_buffer_.length() > 0) {
    processReadBuffer();
  }
}

void ServerConnection::onRejected(const protocol::ConnectResponse& response) {
  sendPacket(codec::Packet(response.toPacket()));
  close(nullopt);
}

std::chrono::milliseconds ServerConnection::idleInterval(
    const codec::Connect& connect,
    const protocol::ConnectResponse& response) const {
  if (response.idleTimeout()) {
    return *response.idleTimeout();
  }
  if (config_.default_idle_timeout.count() > 0) {
    return config_.default_idle_timeout;
  }
  return std::chrono::seconds(connect.keep_alive);
}

// ===== Outbound =====

void ServerConnection::sendPacket(const codec::Packet& packet) {
  if (closed_ || !transport_->isOpen()) {
    return;
  }

  OwnedBuffer frame;
  auto encoded = decoder_.encode(packet, frame);
  if (isError(encoded)) {
    const Error& error = get<Error>(encoded);
    MQTT_CONN_LOG(Error, log_context_, "Failed to encode {}: {}",
                  codec::packetName(packet), error.message);
    deferClose(error);
    return;
  }

  auto written = transport_->write(frame);
  if (isError(written)) {
    deferClose(get<Error>(written));
  }
}

void ServerConnection::deferClose(const optional<Error>& error) {
  std::weak_ptr<ServerConnection> weak = shared_from_this();
  dispatcher_.post([weak, error]() {
    if (auto self = weak.lock()) {
      self->close(error);
    }
  });
}

session::Sink::PacketWriter ServerConnection::makeWriter() {
  std::weak_ptr<ServerConnection> weak = shared_from_this();
  event::Dispatcher* dispatcher = &dispatcher_;
  auto posted = posted_writes_;

  // Called under the sink mutex, so frames are ordered by packet id. A
  // direct write is only safe on the loop thread with nothing posted ahead.
  return [weak, dispatcher, posted](codec::Packet packet) {
    if (dispatcher->isThreadSafe() && posted->load() == 0) {
      if (auto self = weak.lock()) {
        self->sendPacket(packet);
      }
      return;
    }
    posted->fetch_add(1);
    auto shared = std::make_shared<codec::Packet>(std::move(packet));
    dispatcher->post([weak, posted, shared]() {
      posted->fetch_sub(1);
      if (auto self = weak.lock()) {
        self->sendPacket(*shared);
      }
    });
  };
}

session::Sink::CloseRequest ServerConnection::makeCloseRequest() {
  std::weak_ptr<ServerConnection> weak = shared_from_this();
  event::Dispatcher* dispatcher = &dispatcher_;
  return [weak, dispatcher](const optional<Error>& error) {
    dispatcher->post([weak, error]() {
      if (auto self = weak.lock()) {
        self->close(error);
      }
    });
  };
}

// ===== Close =====

void ServerConnection::close(const optional<Error>& error) {
  if (closed_) {
    return;
  }
  closed_ = true;

  keep_alive_.stop();
  handshake_->cancel();
  if (protocol_) {
    protocol_->stop();
  }
  if (sink_) {
    sink_->invalidate(error ? *error
                            : Error(errors::DISCONNECTED, "Connection closed"));
  }

  if (error) {
    MQTT_CONN_LOG(Info, log_context_, "Closing connection ({}): {}",
                  errorCategoryToString(errorCategory(error->code)),
                  error->message);
  } else {
    MQTT_CONN_LOG(Debug, log_context_, "Closing connection");
  }

  if (transport_->isOpen()) {
    transport_->close();
  }

  if (session_ && handlers_.disconnect) {
    try {
      handlers_.disconnect(session_, error.has_value());
    } catch (const std::exception& e) {
      MQTT_CONN_LOG(Error, log_context_, "Disconnect handler threw: {}",
                    e.what());
    }
  }

  if (closed_cb_) {
    closed_cb_(*this);
  }
}

}  // namespace server
}  // namespace mqtt
