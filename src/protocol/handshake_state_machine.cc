#define MQTT_LOG_COMPONENT "protocol.handshake"

#include "mqtt/protocol/handshake_state_machine.h"

#include <atomic>
#include <exception>
#include <utility>

#include "mqtt/logging/log_macros.h"

namespace mqtt {
namespace protocol {

HandshakeStateMachine::HandshakeStateMachine(event::Dispatcher& dispatcher,
                                             HandshakeConfig config)
    : dispatcher_(dispatcher),
      config_(std::move(config)),
      state_entry_time_(std::chrono::steady_clock::now()),
      alive_(std::make_shared<bool>(true)) {}

HandshakeStateMachine::~HandshakeStateMachine() {
  if (timeout_timer_) {
    timeout_timer_->disableTimer();
  }
}

void HandshakeStateMachine::start() {
  if (config_.timeout.count() <= 0 || isComplete()) {
    return;
  }
  timeout_timer_ = dispatcher_.createTimer([this]() { onTimeout(); });
  timeout_timer_->enableTimer(config_.timeout);
}

HandshakeTransitionResult HandshakeStateMachine::onPacket(
    codec::Packet packet) {
  if (state_ != HandshakeState::AwaitConnect) {
    return HandshakeTransitionResult::Failure(
        "Packet received in state " + stateToString(state_));
  }

  auto* connect = get_if<codec::Connect>(&packet);
  if (connect == nullptr) {
    MQTT_LOG(Warning, "Expected CONNECT, got {}", codec::packetName(packet));
    Error error(errors::UNEXPECTED_PACKET,
                "MQTT-3.1.0-1: Expected CONNECT packet");
    fail(error);
    return HandshakeTransitionResult::Failure(error.message);
  }

  MQTT_LOG(Debug, "CONNECT from '{}' keep_alive={}s clean_session={}",
           connect->client_id, connect->keep_alive, connect->clean_session);
  connect_ = std::move(*connect);
  transitionTo(HandshakeState::Authenticating);

  if (!config_.connect_handler) {
    onConnectResponse(ConnectResponse::accept(false));
    return HandshakeTransitionResult::Success(state_);
  }

  std::weak_ptr<bool> alive = alive_;
  auto fired = std::make_shared<std::atomic<bool>>(false);
  event::Dispatcher* dispatcher = &dispatcher_;
  ConnectCompletion done = [this, alive, fired,
                            dispatcher](Result<ConnectResponse> response) {
    if (fired->exchange(true) || alive.expired()) {
      return;
    }
    auto shared =
        std::make_shared<Result<ConnectResponse>>(std::move(response));
    dispatcher->post([this, alive, shared]() {
      if (!alive.expired()) {
        onConnectResponse(std::move(*shared));
      }
    });
  };

  try {
    config_.connect_handler(ConnectRequest(*connect_), done);
  } catch (const std::exception& e) {
    MQTT_LOG(Error, "Connect handler threw: {}", e.what());
    done(Error(errors::HANDLER_ERROR, e.what()));
  }
  return HandshakeTransitionResult::Success(state_);
}

void HandshakeStateMachine::cancel() {
  cancelled_ = true;
  alive_.reset();
  if (timeout_timer_) {
    timeout_timer_->disableTimer();
  }
}

void HandshakeStateMachine::onConnectResponse(
    Result<ConnectResponse> response) {
  if (cancelled_ || state_ != HandshakeState::Authenticating) {
    return;
  }
  if (timeout_timer_) {
    timeout_timer_->disableTimer();
  }

  if (isError(response)) {
    const Error& error = get<Error>(response);
    MQTT_LOG(Warning, "Connect handler failed for '{}': {}",
             connect_->client_id, error.message);
    fail(Error(errors::HANDLER_ERROR, error.message));
    return;
  }

  const ConnectResponse& ack = get<ConnectResponse>(response);
  if (ack.accepted()) {
    transitionTo(HandshakeState::Accepted);
    if (config_.on_accepted) {
      config_.on_accepted(*connect_, ack);
    }
    return;
  }

  MQTT_LOG(Info, "Connection from '{}' refused: {}", connect_->client_id,
           codec::connectCodeReason(ack.code()));
  transitionTo(HandshakeState::Rejected);
  if (config_.on_rejected) {
    config_.on_rejected(ack);
  }
}

void HandshakeStateMachine::onTimeout() {
  if (cancelled_ || isComplete()) {
    return;
  }
  MQTT_LOG(Warning, "Handshake timed out after {} ms in state {}",
           config_.timeout.count(), stateToString(state_));
  fail(Error(errors::HANDSHAKE_TIMEOUT,
             "Handshake not completed within " +
                 std::to_string(config_.timeout.count()) + " ms"));
}

void HandshakeStateMachine::fail(const Error& error) {
  if (timeout_timer_) {
    timeout_timer_->disableTimer();
  }
  transitionTo(HandshakeState::Failed);
  if (config_.on_failed) {
    config_.on_failed(error);
  }
}

void HandshakeStateMachine::transitionTo(HandshakeState new_state) {
  if (new_state == state_) {
    return;
  }
  HandshakeState old_state = state_;
  state_ = new_state;
  state_entry_time_ = std::chrono::steady_clock::now();
  MQTT_LOG(Debug, "Handshake {} -> {}", stateToString(old_state),
           stateToString(new_state));
  if (config_.state_change_callback) {
    config_.state_change_callback(old_state, new_state);
  }
}

std::chrono::milliseconds HandshakeStateMachine::getTimeInCurrentState()
    const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - state_entry_time_);
}

std::string HandshakeStateMachine::stateToString(HandshakeState state) {
  switch (state) {
    case HandshakeState::AwaitConnect: return "AwaitConnect";
    case HandshakeState::Authenticating: return "Authenticating";
    case HandshakeState::Accepted: return "Accepted";
    case HandshakeState::Rejected: return "Rejected";
    case HandshakeState::Failed: return "Failed";
  }
  return "Unknown";
}

}  // namespace protocol
}  // namespace mqtt
