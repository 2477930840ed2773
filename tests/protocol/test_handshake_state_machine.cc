/**
 * @file test_handshake_state_machine.cc
 * @brief Unit tests for the CONNECT / CONNACK handshake
 */

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "mqtt/event/event_loop.h"
#include "mqtt/protocol/handshake_state_machine.h"

namespace mqtt {
namespace protocol {
namespace {

using namespace std::chrono_literals;

codec::Connect makeConnect(const std::string& client_id = "client-1") {
  codec::Connect connect;
  connect.clean_session = true;
  connect.keep_alive = 30;
  connect.client_id = client_id;
  return connect;
}

class HandshakeStateMachineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto factory = event::createLibeventDispatcherFactory();
    dispatcher_ = factory->createDispatcher("test");
    dispatcher_->run(event::RunType::NonBlock);

    config_.on_accepted = [this](const codec::Connect& connect,
                                 const ConnectResponse& response) {
      accepted_client_ = connect.client_id;
      accepted_.push_back(response);
    };
    config_.on_rejected = [this](const ConnectResponse& response) {
      rejected_.push_back(response);
    };
    config_.on_failed = [this](const Error& error) {
      failures_.push_back(error);
    };
    config_.state_change_callback = [this](HandshakeState from,
                                           HandshakeState to) {
      transitions_.emplace_back(from, to);
    };
  }

  void TearDown() override {
    machine_.reset();
    dispatcher_.reset();
  }

  void create() {
    machine_ = std::make_unique<HandshakeStateMachine>(*dispatcher_, config_);
    machine_->start();
  }

  void drain() {
    for (int i = 0; i < 3; ++i) {
      dispatcher_->run(event::RunType::NonBlock);
    }
  }

  bool runUntil(std::function<bool()> condition,
                std::chrono::milliseconds limit = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
      dispatcher_->run(event::RunType::NonBlock);
      if (condition()) {
        return true;
      }
      std::this_thread::sleep_for(2ms);
    }
    return condition();
  }

  event::DispatcherPtr dispatcher_;
  HandshakeConfig config_;
  std::unique_ptr<HandshakeStateMachine> machine_;

  std::string accepted_client_;
  std::vector<ConnectResponse> accepted_;
  std::vector<ConnectResponse> rejected_;
  std::vector<Error> failures_;
  std::vector<std::pair<HandshakeState, HandshakeState>> transitions_;
};

// =============================================================================
// Accept and reject
// =============================================================================

TEST_F(HandshakeStateMachineTest, NoHandlerAcceptsImmediately) {
  create();
  auto result = machine_->onPacket(makeConnect());

  EXPECT_TRUE(result.success);
  EXPECT_EQ(HandshakeState::Accepted, machine_->currentState());
  EXPECT_TRUE(machine_->isComplete());
  ASSERT_EQ(1u, accepted_.size());
  EXPECT_EQ("client-1", accepted_client_);
  EXPECT_FALSE(accepted_[0].sessionPresent());
}

TEST_F(HandshakeStateMachineTest, HandlerAcceptAfterPost) {
  ConnectCompletion pending;
  config_.connect_handler = [&](const ConnectRequest& request,
                                ConnectCompletion done) {
    EXPECT_EQ("client-1", request.clientId());
    EXPECT_EQ(30, request.keepAlive());
    pending = std::move(done);
  };
  create();

  auto result = machine_->onPacket(makeConnect());
  EXPECT_TRUE(result.success);
  EXPECT_EQ(HandshakeState::Authenticating, result.resulting_state);
  EXPECT_EQ(HandshakeState::Authenticating, machine_->currentState());

  pending(ConnectResponse::accept(true).inflight(4));
  EXPECT_TRUE(accepted_.empty());
  drain();

  ASSERT_EQ(1u, accepted_.size());
  EXPECT_TRUE(accepted_[0].sessionPresent());
  ASSERT_TRUE(accepted_[0].inflight().has_value());
  EXPECT_EQ(4u, *accepted_[0].inflight());
  EXPECT_EQ(HandshakeState::Accepted, machine_->currentState());

  ASSERT_EQ(2u, transitions_.size());
  EXPECT_EQ(HandshakeState::AwaitConnect, transitions_[0].first);
  EXPECT_EQ(HandshakeState::Authenticating, transitions_[0].second);
  EXPECT_EQ(HandshakeState::Accepted, transitions_[1].second);
}

TEST_F(HandshakeStateMachineTest, RejectCodes) {
  const ConnectResponse responses[] = {
      ConnectResponse::identifierRejected(),
      ConnectResponse::badUserNameOrPassword(),
      ConnectResponse::notAuthorized(),
      ConnectResponse::serviceUnavailable(),
  };
  const codec::ConnectCode codes[] = {
      codec::ConnectCode::IdentifierRejected,
      codec::ConnectCode::BadUserNameOrPassword,
      codec::ConnectCode::NotAuthorized,
      codec::ConnectCode::ServiceUnavailable,
  };

  for (size_t i = 0; i < 4; ++i) {
    rejected_.clear();
    ConnectResponse response = responses[i];
    config_.connect_handler = [response](const ConnectRequest&,
                                         ConnectCompletion done) {
      done(response);
    };
    create();
    machine_->onPacket(makeConnect());
    drain();

    ASSERT_EQ(1u, rejected_.size()) << i;
    EXPECT_EQ(codes[i], rejected_[0].code());
    EXPECT_FALSE(rejected_[0].toPacket().session_present);
    EXPECT_EQ(codes[i], rejected_[0].toPacket().return_code);
    EXPECT_EQ(HandshakeState::Rejected, machine_->currentState());
  }
  EXPECT_TRUE(accepted_.empty());
}

TEST_F(HandshakeStateMachineTest, RejectNeverReportsSessionPresent) {
  ConnectResponse response = ConnectResponse::notAuthorized();
  EXPECT_FALSE(response.accepted());
  EXPECT_FALSE(response.toPacket().session_present);

  ConnectResponse accepted = ConnectResponse::accept(true);
  EXPECT_TRUE(accepted.toPacket().session_present);
  EXPECT_EQ(codec::ConnectCode::Accepted, accepted.toPacket().return_code);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(HandshakeStateMachineTest, NonConnectFirstPacketFails) {
  create();
  auto result = machine_->onPacket(codec::PingRequest{});

  EXPECT_FALSE(result.success);
  EXPECT_EQ(HandshakeState::Failed, result.resulting_state);
  EXPECT_EQ(HandshakeState::Failed, machine_->currentState());
  ASSERT_EQ(1u, failures_.size());
  EXPECT_EQ(errors::UNEXPECTED_PACKET, failures_[0].code);
}

TEST_F(HandshakeStateMachineTest, SecondPacketIsRejected) {
  config_.connect_handler = [](const ConnectRequest&, ConnectCompletion) {};
  create();
  machine_->onPacket(makeConnect());

  auto result = machine_->onPacket(makeConnect());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(HandshakeState::Authenticating, machine_->currentState());
}

TEST_F(HandshakeStateMachineTest, HandlerErrorFails) {
  config_.connect_handler = [](const ConnectRequest&, ConnectCompletion done) {
    done(Error(errors::IO_ERROR, "user store unavailable"));
  };
  create();
  machine_->onPacket(makeConnect());
  drain();

  ASSERT_EQ(1u, failures_.size());
  EXPECT_EQ(errors::HANDLER_ERROR, failures_[0].code);
  EXPECT_EQ("user store unavailable", failures_[0].message);
  EXPECT_EQ(HandshakeState::Failed, machine_->currentState());
}

TEST_F(HandshakeStateMachineTest, ThrowingHandlerFails) {
  config_.connect_handler = [](const ConnectRequest&, ConnectCompletion) {
    throw std::runtime_error("bad handler");
  };
  create();
  machine_->onPacket(makeConnect());
  drain();

  ASSERT_EQ(1u, failures_.size());
  EXPECT_EQ(errors::HANDLER_ERROR, failures_[0].code);
}

TEST_F(HandshakeStateMachineTest, TimeoutWaitingForConnect) {
  config_.timeout = 30ms;
  create();

  ASSERT_TRUE(runUntil([this]() { return !failures_.empty(); }));
  EXPECT_EQ(errors::HANDSHAKE_TIMEOUT, failures_[0].code);
  EXPECT_EQ(HandshakeState::Failed, machine_->currentState());
}

TEST_F(HandshakeStateMachineTest, TimeoutCoversSlowHandler) {
  ConnectCompletion pending;
  config_.timeout = 30ms;
  config_.connect_handler = [&](const ConnectRequest&,
                                ConnectCompletion done) {
    pending = std::move(done);
  };
  create();
  machine_->onPacket(makeConnect());

  ASSERT_TRUE(runUntil([this]() { return !failures_.empty(); }));
  EXPECT_EQ(errors::HANDSHAKE_TIMEOUT, failures_[0].code);

  // A late response is ignored
  pending(ConnectResponse::accept());
  drain();
  EXPECT_TRUE(accepted_.empty());
  EXPECT_EQ(HandshakeState::Failed, machine_->currentState());
}

TEST_F(HandshakeStateMachineTest, AcceptDisarmsTimeout) {
  config_.timeout = 20ms;
  create();
  machine_->onPacket(makeConnect());

  runUntil([]() { return false; }, 60ms);
  EXPECT_TRUE(failures_.empty());
  EXPECT_EQ(HandshakeState::Accepted, machine_->currentState());
}

TEST_F(HandshakeStateMachineTest, CancelSuppressesCallbacks) {
  ConnectCompletion pending;
  config_.timeout = 20ms;
  config_.connect_handler = [&](const ConnectRequest&,
                                ConnectCompletion done) {
    pending = std::move(done);
  };
  create();
  machine_->onPacket(makeConnect());
  machine_->cancel();

  pending(ConnectResponse::accept());
  runUntil([]() { return false; }, 50ms);
  EXPECT_TRUE(accepted_.empty());
  EXPECT_TRUE(failures_.empty());
}

TEST(HandshakeStateToStringTest, Names) {
  EXPECT_EQ("AwaitConnect",
            HandshakeStateMachine::stateToString(HandshakeState::AwaitConnect));
  EXPECT_EQ("Failed",
            HandshakeStateMachine::stateToString(HandshakeState::Failed));
}

}  // namespace
}  // namespace protocol
}  // namespace mqtt
