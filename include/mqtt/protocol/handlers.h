/**
 * @file handlers.h
 * @brief Application handler signatures and the request objects they see
 *
 * Every handler is asynchronous: it receives a request and a completion
 * callback. Completions may be invoked from any thread, exactly once; the
 * connection marshals them back to its dispatcher thread.
 */

#ifndef MQTT_PROTOCOL_HANDLERS_H
#define MQTT_PROTOCOL_HANDLERS_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "mqtt/codec/packet.h"
#include "mqtt/core/result.h"
#include "mqtt/session/session.h"

namespace mqtt {
namespace protocol {

// ===== Connect =====

class ConnectRequest {
 public:
  explicit ConnectRequest(codec::Connect packet) : packet_(std::move(packet)) {}

  const codec::Connect& packet() const { return packet_; }

  const std::string& clientId() const { return packet_.client_id; }
  bool cleanSession() const { return packet_.clean_session; }
  uint16_t keepAlive() const { return packet_.keep_alive; }
  const optional<codec::LastWill>& lastWill() const {
    return packet_.last_will;
  }
  const optional<std::string>& username() const { return packet_.username; }
  const optional<codec::Bytes>& password() const { return packet_.password; }

 private:
  codec::Connect packet_;
};

/**
 * Outcome of the connect handler: accept, or reject with a CONNACK code.
 */
class ConnectResponse {
 public:
  static ConnectResponse accept(bool session_present = false) {
    return ConnectResponse(codec::ConnectCode::Accepted, session_present);
  }
  static ConnectResponse identifierRejected() {
    return ConnectResponse(codec::ConnectCode::IdentifierRejected, false);
  }
  static ConnectResponse badUserNameOrPassword() {
    return ConnectResponse(codec::ConnectCode::BadUserNameOrPassword, false);
  }
  static ConnectResponse notAuthorized() {
    return ConnectResponse(codec::ConnectCode::NotAuthorized, false);
  }
  static ConnectResponse serviceUnavailable() {
    return ConnectResponse(codec::ConnectCode::ServiceUnavailable, false);
  }

  // Override the keep-alive derived from CONNECT. Zero disables it.
  ConnectResponse& idleTimeout(std::chrono::milliseconds timeout) {
    idle_timeout_ = timeout;
    return *this;
  }

  // Override the connection's in-flight limit
  ConnectResponse& inflight(size_t max_inflight) {
    inflight_ = max_inflight;
    return *this;
  }

  // Attach application state reachable from every later handler
  ConnectResponse& state(std::shared_ptr<void> state) {
    state_ = std::move(state);
    return *this;
  }

  bool accepted() const { return code_ == codec::ConnectCode::Accepted; }
  codec::ConnectCode code() const { return code_; }
  bool sessionPresent() const { return session_present_; }
  const optional<std::chrono::milliseconds>& idleTimeout() const {
    return idle_timeout_;
  }
  const optional<size_t>& inflight() const { return inflight_; }
  const std::shared_ptr<void>& state() const { return state_; }

  codec::ConnectAck toPacket() const {
    codec::ConnectAck ack;
    ack.session_present = accepted() && session_present_;
    ack.return_code = code_;
    return ack;
  }

 private:
  ConnectResponse(codec::ConnectCode code, bool session_present)
      : code_(code), session_present_(session_present) {}

  codec::ConnectCode code_;
  bool session_present_;
  optional<std::chrono::milliseconds> idle_timeout_;
  optional<size_t> inflight_;
  std::shared_ptr<void> state_;
};

// ===== Publish =====

/**
 * Inbound PUBLISH as seen by the publish handler. The topic is split at the
 * first '?' into topic and query.
 */
class PublishMessage {
 public:
  PublishMessage(codec::Publish packet, session::SessionSharedPtr session);

  // Topic as received, including any query part
  const std::string& publishTopic() const { return packet_.topic; }
  const std::string& topic() const { return topic_; }
  // Empty when the topic has no '?'
  const std::string& query() const { return query_; }

  codec::QoS qos() const { return packet_.qos; }
  bool dup() const { return packet_.dup; }
  bool retain() const { return packet_.retain; }
  const optional<uint16_t>& packetId() const { return packet_.packet_id; }
  const codec::Bytes& payload() const { return packet_.payload; }

  // Parse the payload as JSON
  Result<nlohmann::json> payloadJson() const;

  const codec::Publish& packet() const { return packet_; }
  session::Session& session() const { return *session_; }
  const session::SessionSharedPtr& sessionPtr() const { return session_; }
  session::Sink& sink() const { return session_->sink(); }

 private:
  codec::Publish packet_;
  session::SessionSharedPtr session_;
  std::string topic_;
  std::string query_;
};

// ===== Subscribe =====

/**
 * SUBSCRIBE entries with one outcome slot each. Slots start as Failure;
 * the handler grants or fails each index and hands the request back.
 */
class SubscribeRequest {
 public:
  SubscribeRequest(codec::Subscribe packet, session::SessionSharedPtr session);

  size_t size() const { return packet_.topic_filters.size(); }
  bool empty() const { return packet_.topic_filters.empty(); }

  const std::string& filter(size_t index) const {
    return packet_.topic_filters.at(index).filter;
  }
  codec::QoS requestedQoS(size_t index) const {
    return packet_.topic_filters.at(index).qos;
  }

  void grant(size_t index, codec::QoS qos) {
    outcomes_.at(index) = codec::SubscribeReturnCode::Success(qos);
  }
  void grantRequested(size_t index) { grant(index, requestedQoS(index)); }
  void fail(size_t index) {
    outcomes_.at(index) = codec::SubscribeReturnCode::Failure();
  }

  const codec::SubscribeReturnCode& outcome(size_t index) const {
    return outcomes_.at(index);
  }
  const std::vector<codec::SubscribeReturnCode>& outcomes() const {
    return outcomes_;
  }

  uint16_t packetId() const { return packet_.packet_id; }
  const std::vector<codec::SubscribeTopic>& topics() const {
    return packet_.topic_filters;
  }

  session::Session& session() const { return *session_; }
  const session::SessionSharedPtr& sessionPtr() const { return session_; }

  // SUBACK carrying the outcomes in request order
  codec::SubscribeAck toAck() const;

 private:
  codec::Subscribe packet_;
  std::vector<codec::SubscribeReturnCode> outcomes_;
  session::SessionSharedPtr session_;
};

// ===== Unsubscribe =====

class UnsubscribeRequest {
 public:
  UnsubscribeRequest(codec::Unsubscribe packet,
                     session::SessionSharedPtr session)
      : packet_(std::move(packet)), session_(std::move(session)) {}

  uint16_t packetId() const { return packet_.packet_id; }
  const std::vector<std::string>& topics() const {
    return packet_.topic_filters;
  }

  session::Session& session() const { return *session_; }
  const session::SessionSharedPtr& sessionPtr() const { return session_; }

 private:
  codec::Unsubscribe packet_;
  session::SessionSharedPtr session_;
};

// ===== Handler signatures =====

using HandlerCompletion = std::function<void(VoidResult)>;

using ConnectCompletion = std::function<void(Result<ConnectResponse>)>;
using ConnectHandler =
    std::function<void(const ConnectRequest&, ConnectCompletion)>;

using PublishHandler =
    std::function<void(const PublishMessage&, HandlerCompletion)>;

using SubscribeCompletion = std::function<void(Result<SubscribeRequest>)>;
using SubscribeHandler =
    std::function<void(SubscribeRequest, SubscribeCompletion)>;

using UnsubscribeHandler =
    std::function<void(const UnsubscribeRequest&, HandlerCompletion)>;

// Handlers used once a connection is established
struct SessionHandlers {
  PublishHandler publish;
  SubscribeHandler subscribe;
  UnsubscribeHandler unsubscribe;
};

// Acknowledges and logs a warning
PublishHandler defaultPublishHandler();

// Fails every entry and logs a warning
SubscribeHandler defaultSubscribeHandler();

// Succeeds and logs a warning
UnsubscribeHandler defaultUnsubscribeHandler();

// Fills unset handlers with the defaults above
SessionHandlers withDefaults(SessionHandlers handlers);

}  // namespace protocol
}  // namespace mqtt

#endif  // MQTT_PROTOCOL_HANDLERS_H
