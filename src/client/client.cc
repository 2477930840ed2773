#define MQTT_LOG_COMPONENT "client"

#include "mqtt/client/client.h"

#include <exception>
#include <utility>

#include "mqtt/logging/log_macros.h"
#include "mqtt/transport/tcp_transport.h"

namespace mqtt {
namespace client {

const char* clientStateToString(ClientState state) {
  switch (state) {
    case ClientState::Idle: return "Idle";
    case ClientState::Connecting: return "Connecting";
    case ClientState::Connected: return "Connected";
    case ClientState::Closed: return "Closed";
  }
  return "Unknown";
}

ClientSharedPtr Client::create(event::Dispatcher& dispatcher,
                               ClientOptions options,
                               ClientHandlers handlers) {
  return ClientSharedPtr(
      new Client(dispatcher, std::move(options), std::move(handlers)));
}

Client::Client(event::Dispatcher& dispatcher,
               ClientOptions options,
               ClientHandlers handlers)
    : dispatcher_(dispatcher),
      options_(std::move(options)),
      handlers_(std::move(handlers)),
      decoder_(options_.max_frame_size),
      posted_writes_(std::make_shared<std::atomic<size_t>>(0)) {
  log_context_.client_id = options_.client_id;
}

Client::~Client() {
  handlers_.disconnect = nullptr;
  connect_cb_ = nullptr;
  if (state_ != ClientState::Closed) {
    close(Error(errors::DISCONNECTED, "Client destroyed"));
  }
}

codec::Connect Client::connectPacket() const {
  codec::Connect connect;
  connect.clean_session = options_.clean_session;
  connect.keep_alive = options_.keep_alive;
  connect.client_id = options_.client_id;
  connect.last_will = options_.last_will;
  connect.username = options_.username;
  connect.password = options_.password;
  return connect;
}

void Client::connect(const std::string& host,
                     uint16_t port,
                     ConnectCallback callback) {
  auto transport = transport::TcpTransport::connect(dispatcher_, host, port);
  if (isError(transport)) {
    const Error& error = get<Error>(transport);
    MQTT_CONN_LOG(Error, log_context_, "Failed to connect to {}:{}: {}", host,
                  port, error.message);
    state_ = ClientState::Closed;
    if (callback) {
      callback(error);
    }
    return;
  }
  connect(std::move(get<transport::TransportPtr>(transport)),
          std::move(callback));
}

void Client::connect(transport::TransportPtr transport,
                     ConnectCallback callback) {
  if (state_ != ClientState::Idle) {
    if (callback) {
      callback(Error(errors::UNEXPECTED_PACKET,
                     std::string("connect() called in state ") +
                         clientStateToString(state_)));
    }
    return;
  }

  transport_ = std::move(transport);
  connect_cb_ = std::move(callback);
  state_ = ClientState::Connecting;
  transport_->setTransportCallbacks(*this);

  if (options_.handshake_timeout.count() > 0) {
    handshake_timer_ = dispatcher_.createTimer([this]() {
      onHandshakeTimeout();
    });
    handshake_timer_->enableTimer(options_.handshake_timeout);
  }

  MQTT_CONN_LOG(Debug, log_context_, "Sending CONNECT (keep_alive={}s)",
                options_.keep_alive);
  sendPacket(codec::Packet(connectPacket()));
}

void Client::disconnect() {
  if (state_ == ClientState::Closed) {
    return;
  }
  sendPacket(codec::Packet(codec::Disconnect{}));
  close(nullopt);
}

// ===== Inbound =====

void Client::onData(Buffer& data) {
  if (state_ == ClientState::Closed) {
    data.drain(data.length());
    return;
  }
  data.move(read_buffer_);
  processReadBuffer();
}

void Client::processReadBuffer() {
  if (processing_) {
    return;
  }
  processing_ = true;

  while (state_ != ClientState::Closed && read_buffer_.length() > 0) {
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

    if (state_ == ClientState::Connecting) {
      onConnectAck(*packet);
    } else if (protocol_) {
      protocol_->onPacket(std::move(*packet));
    }
  }

  processing_ = false;
}

void Client::onConnectAck(const codec::Packet& packet) {
  if (handshake_timer_) {
    handshake_timer_->disableTimer();
  }

  auto* ack = get_if<codec::ConnectAck>(&packet);
  if (ack == nullptr) {
    Error error(errors::UNEXPECTED_PACKET,
                std::string("Expected CONNACK packet, got ") +
                    codec::packetName(packet));
    MQTT_CONN_LOG(Warning, log_context_, "{}", error.message);
    completeConnect(error);
    close(error);
    return;
  }

  connect_code_ = ack->return_code;
  if (ack->return_code != codec::ConnectCode::Accepted) {
    Error error(errors::CONNECTION_REFUSED,
                codec::connectCodeReason(ack->return_code));
    MQTT_CONN_LOG(Info, log_context_, "Connection refused: {}",
                  error.message);
    completeConnect(error);
    close(nullopt);
    return;
  }

  sink_ = std::make_shared<session::Sink>(makeWriter(), makeCloseRequest());
  session_ = std::make_shared<session::Session>(options_.client_id,
                                                options_.username, sink_);

  protocol::ProtocolDispatcherConfig pd;
  pd.max_inflight = options_.inflight;
  pd.send_packet = [this](codec::Packet reply) { sendPacket(reply); };
  pd.close = [this](const optional<Error>& error) { close(error); };
  protocol_ = std::make_unique<protocol::ProtocolDispatcher>(
      dispatcher_, session_, handlers_.session, std::move(pd));

  if (options_.keep_alive > 0) {
    ping_timer_ = dispatcher_.createTimer([this]() { onPingTimer(); });
    ping_timer_->enableTimer(std::chrono::seconds(options_.keep_alive));
  }

  state_ = ClientState::Connected;
  MQTT_CONN_LOG(Info, log_context_, "Connected (session_present={})",
                ack->session_present);

  ConnectResult result;
  result.session_present = ack->session_present;
  result.session = session_;
  completeConnect(std::move(result));
}

void Client::onHandshakeTimeout() {
  if (state_ != ClientState::Connecting) {
    return;
  }
  Error error(errors::HANDSHAKE_TIMEOUT,
              "CONNACK not received within " +
                  std::to_string(options_.handshake_timeout.count()) + " ms");
  MQTT_CONN_LOG(Warning, log_context_, "{}", error.message);
  completeConnect(error);
  close(error);
}

void Client::onPingTimer() {
  if (state_ != ClientState::Connected) {
    return;
  }
  sendPacket(codec::Packet(codec::PingRequest{}));
  ping_timer_->enableTimer(std::chrono::seconds(options_.keep_alive));
}

void Client::completeConnect(Result<ConnectResult> result) {
  if (!connect_cb_) {
    return;
  }
  ConnectCallback callback = std::move(connect_cb_);
  connect_cb_ = nullptr;
  callback(std::move(result));
}

void Client::onClose(transport::ConnectionEvent event) {
  if (state_ == ClientState::Closed) {
    return;
  }
  MQTT_CONN_LOG(Debug, log_context_, "Transport closed: {}",
                transport::connectionEventToString(event));
  close(Error(errors::DISCONNECTED, "Connection closed by peer"));
}

// ===== Outbound =====

void Client::sendPacket(const codec::Packet& packet) {
  if (state_ == ClientState::Closed || !transport_ || !transport_->isOpen()) {
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

void Client::deferClose(const optional<Error>& error) {
  std::weak_ptr<Client> weak = shared_from_this();
  dispatcher_.post([weak, error]() {
    if (auto self = weak.lock()) {
      self->close(error);
    }
  });
}

session::Sink::PacketWriter Client::makeWriter() {
  std::weak_ptr<Client> weak = shared_from_this();
  event::Dispatcher* dispatcher = &dispatcher_;
  auto posted = posted_writes_;

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

session::Sink::CloseRequest Client::makeCloseRequest() {
  std::weak_ptr<Client> weak = shared_from_this();
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

void Client::close(const optional<Error>& error) {
  if (state_ == ClientState::Closed) {
    return;
  }
  state_ = ClientState::Closed;

  if (handshake_timer_) {
    handshake_timer_->disableTimer();
  }
  if (ping_timer_) {
    ping_timer_->disableTimer();
  }
  if (protocol_) {
    protocol_->stop();
  }
  if (sink_) {
    sink_->invalidate(error ? *error
                            : Error(errors::DISCONNECTED, "Connection closed"));
  }

  if (error) {
    MQTT_CONN_LOG(Info, log_context_, "Closing: {}", error->message);
    completeConnect(*error);
  } else {
    MQTT_CONN_LOG(Debug, log_context_, "Closing");
    completeConnect(Error(errors::DISCONNECTED, "Connection closed"));
  }

  if (transport_ && transport_->isOpen()) {
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
}

// ===== Builder =====

ClientBuilder::ClientBuilder(std::string client_id) {
  options_.client_id = std::move(client_id);
}

ClientBuilder& ClientBuilder::cleanSession(bool value) {
  options_.clean_session = value;
  return *this;
}

ClientBuilder& ClientBuilder::keepAlive(uint16_t seconds) {
  options_.keep_alive = seconds;
  return *this;
}

ClientBuilder& ClientBuilder::lastWill(codec::LastWill will) {
  options_.last_will = std::move(will);
  return *this;
}

ClientBuilder& ClientBuilder::username(std::string value) {
  options_.username = std::move(value);
  return *this;
}

ClientBuilder& ClientBuilder::password(codec::Bytes value) {
  options_.password = std::move(value);
  return *this;
}

ClientBuilder& ClientBuilder::inflight(size_t value) {
  options_.inflight = value;
  return *this;
}

ClientBuilder& ClientBuilder::handshakeTimeout(
    std::chrono::milliseconds timeout) {
  options_.handshake_timeout = timeout;
  return *this;
}

ClientBuilder& ClientBuilder::maxFrameSize(uint32_t value) {
  options_.max_frame_size = value;
  return *this;
}

ClientBuilder& ClientBuilder::publishHandler(protocol::PublishHandler handler) {
  handlers_.session.publish = std::move(handler);
  return *this;
}

ClientBuilder& ClientBuilder::subscribeHandler(
    protocol::SubscribeHandler handler) {
  handlers_.session.subscribe = std::move(handler);
  return *this;
}

ClientBuilder& ClientBuilder::unsubscribeHandler(
    protocol::UnsubscribeHandler handler) {
  handlers_.session.unsubscribe = std::move(handler);
  return *this;
}

ClientBuilder& ClientBuilder::disconnectHandler(DisconnectHandler handler) {
  handlers_.disconnect = std::move(handler);
  return *this;
}

ClientSharedPtr ClientBuilder::build(event::Dispatcher& dispatcher) const {
  return Client::create(dispatcher, options_, handlers_);
}

}  // namespace client
}  // namespace mqtt
