/**
 * @file handshake_state_machine.h
 * @brief Bounded-time CONNECT / CONNACK handshake
 *
 * States:
 *   AwaitConnect --CONNECT--> Authenticating --accept--> Accepted
 *                                            --reject--> Rejected
 *   AwaitConnect --other packet--> Failed (protocol violation)
 *   AwaitConnect | Authenticating --timeout--> Failed (handshake timeout)
 *   Authenticating --handler error--> Failed
 *
 * The timeout covers both waiting for CONNECT and waiting for the connect
 * handler. A zero timeout disables it.
 */

#ifndef MQTT_PROTOCOL_HANDSHAKE_STATE_MACHINE_H
#define MQTT_PROTOCOL_HANDSHAKE_STATE_MACHINE_H

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "mqtt/codec/packet.h"
#include "mqtt/core/result.h"
#include "mqtt/event/event_loop.h"
#include "mqtt/protocol/handlers.h"

namespace mqtt {
namespace protocol {

enum class HandshakeState {
  AwaitConnect,    // waiting for the first packet
  Authenticating,  // connect handler invoked, waiting for its response
  Accepted,        // terminal: CONNACK accepted
  Rejected,        // terminal: CONNACK with a refusal code
  Failed           // terminal: protocol violation, timeout or handler error
};

struct HandshakeTransitionResult {
  bool success{false};
  std::string error_message;
  HandshakeState resulting_state;

  static HandshakeTransitionResult Success(HandshakeState state) {
    return {true, "", state};
  }

  static HandshakeTransitionResult Failure(const std::string& error) {
    return {false, error, HandshakeState::Failed};
  }
};

struct HandshakeConfig {
  // Zero disables the timeout
  std::chrono::milliseconds timeout{0};

  ConnectHandler connect_handler;

  // Accepted: the owner sends CONNACK and switches to steady state
  std::function<void(const codec::Connect&, const ConnectResponse&)>
      on_accepted;

  // Rejected: the owner sends CONNACK and closes
  std::function<void(const ConnectResponse&)> on_rejected;

  // Failed: the owner closes with the error
  std::function<void(const Error&)> on_failed;

  std::function<void(HandshakeState from, HandshakeState to)>
      state_change_callback;
};

class HandshakeStateMachine {
 public:
  HandshakeStateMachine(event::Dispatcher& dispatcher, HandshakeConfig config);
  ~HandshakeStateMachine();

  HandshakeStateMachine(const HandshakeStateMachine&) = delete;
  HandshakeStateMachine& operator=(const HandshakeStateMachine&) = delete;

  // Arms the timeout
  void start();

  /**
   * Feed the first decoded packet. Only valid in AwaitConnect.
   */
  HandshakeTransitionResult onPacket(codec::Packet packet);

  // Connection went away; no callbacks fire afterwards
  void cancel();

  HandshakeState currentState() const { return state_; }

  bool isComplete() const {
    return state_ == HandshakeState::Accepted ||
           state_ == HandshakeState::Rejected ||
           state_ == HandshakeState::Failed;
  }

  std::chrono::milliseconds getTimeInCurrentState() const;

  static std::string stateToString(HandshakeState state);

 private:
  void transitionTo(HandshakeState new_state);
  void onConnectResponse(Result<ConnectResponse> response);
  void onTimeout();
  void fail(const Error& error);

  event::Dispatcher& dispatcher_;
  HandshakeConfig config_;
  HandshakeState state_{HandshakeState::AwaitConnect};
  std::chrono::steady_clock::time_point state_entry_time_;
  event::TimerPtr timeout_timer_;
  optional<codec::Connect> connect_;
  bool cancelled_{false};

  // Expires with this object so posted responses can detect it
  std::shared_ptr<bool> alive_;
};

}  // namespace protocol
}  // namespace mqtt

#endif  // MQTT_PROTOCOL_HANDSHAKE_STATE_MACHINE_H
