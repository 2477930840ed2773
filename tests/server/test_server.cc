/**
 * @file test_server.cc
 * @brief Server tests over real sockets
 *
 * Both ends run on one dispatcher: the server side through the listener or
 * addConnection(), the peer through the client.
 */

#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "mqtt/client/client.h"
#include "mqtt/event/event_loop.h"
#include "mqtt/server/router.h"
#include "mqtt/server/server.h"
#include "mqtt/transport/tcp_transport.h"

namespace mqtt {
namespace server {
namespace {

using namespace std::chrono_literals;

class ServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto factory = event::createLibeventDispatcherFactory();
    dispatcher_ = factory->createDispatcher("test");
    dispatcher_->run(event::RunType::NonBlock);

    config_.port = 0;
    config_.keep_alive_tick = 10ms;
  }

  void TearDown() override {
    client_.reset();
    server_.reset();
    dispatcher_.reset();
  }

  void createServer() {
    server_ = std::make_unique<Server>(*dispatcher_, config_);
    server_->setDisconnectHandler(
        [this](const session::SessionSharedPtr& session, bool error) {
          disconnects_.push_back(session->clientId() + ":" +
                                 (error ? "error" : "clean"));
        });
  }

  bool runUntil(std::function<bool()> condition,
                std::chrono::milliseconds limit = 3000ms) {
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

  client::ClientSharedPtr makeClient(const std::string& client_id) {
    return client::ClientBuilder(client_id)
        .keepAlive(0)
        .publishHandler([this](const protocol::PublishMessage& message,
                               protocol::HandlerCompletion done) {
          client_received_.push_back(message.topic() + "=" +
                                     message.payload());
          done(makeVoidSuccess());
        })
        .build(*dispatcher_);
  }

  // Connects a fresh client over a socketpair served by addConnection()
  void connectPair(const std::string& client_id) {
    int fds[2];
    ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
    server_->addConnection(transport::TransportPtr(
        new transport::TcpTransport(*dispatcher_, fds[0])));

    client_ = makeClient(client_id);
    client_->connect(transport::TransportPtr(new transport::TcpTransport(
                         *dispatcher_, fds[1])),
                     [this](Result<client::ConnectResult> result) {
                       connect_results_.push_back(std::move(result));
                     });
    ASSERT_TRUE(runUntil([this]() { return !connect_results_.empty(); }));
  }

  event::DispatcherPtr dispatcher_;
  config::ServerConfig config_;
  std::unique_ptr<Server> server_;
  client::ClientSharedPtr client_;

  std::vector<Result<client::ConnectResult>> connect_results_;
  std::vector<std::string> client_received_;
  std::vector<std::string> disconnects_;
};

TEST_F(ServerTest, PortIsZeroBeforeListen) {
  createServer();
  EXPECT_EQ(0, server_->port());
  EXPECT_EQ(0u, server_->connectionCount());
}

TEST_F(ServerTest, ConnectionConfigFollowsServerConfig) {
  config_.max_frame_size = 4096;
  config_.max_inflight = 7;
  config_.handshake_timeout = 2s;
  config_.default_idle_timeout = 90s;
  createServer();

  ConnectionConfig connection = server_->connectionConfig();
  EXPECT_EQ(4096u, connection.max_frame_size);
  EXPECT_EQ(7u, connection.max_inflight);
  EXPECT_EQ(2000ms, connection.handshake_timeout);
  EXPECT_EQ(10ms, connection.keep_alive_tick);
  EXPECT_EQ(90000ms, connection.default_idle_timeout);
}

TEST_F(ServerTest, InvalidConfigThrows) {
  config_.address = "";
  EXPECT_THROW(createServer(), config::ConfigValidationError);
}

TEST_F(ServerTest, SocketPairSessionPublishesBothWays) {
  std::vector<std::string> server_received;
  session::SessionSharedPtr server_session;
  createServer();
  server_->setConnectHandler([&](const protocol::ConnectRequest& request,
                                 protocol::ConnectCompletion done) {
    EXPECT_EQ("sensor-1", request.clientId());
    done(protocol::ConnectResponse::accept());
  });
  server_->setPublishHandler([&](const protocol::PublishMessage& message,
                                 protocol::HandlerCompletion done) {
    server_received.push_back(message.topic() + "=" + message.payload());
    server_session = message.sessionPtr();
    done(makeVoidSuccess());
  });

  connectPair("sensor-1");
  ASSERT_FALSE(isError(connect_results_[0]));
  EXPECT_EQ(1u, server_->connectionCount());
  EXPECT_EQ(client::ClientState::Connected, client_->state());

  // Client to server
  std::vector<VoidResult> acks;
  client_->session()->sink().publishAtLeastOnce(
      "sensors/temp", "21.5",
      [&](const VoidResult& result) { acks.push_back(result); });
  ASSERT_TRUE(runUntil([&]() { return !acks.empty(); }));
  EXPECT_FALSE(isError(acks[0]));
  ASSERT_EQ(1u, server_received.size());
  EXPECT_EQ("sensors/temp=21.5", server_received[0]);

  // Server to client through the session handed to the handler
  ASSERT_NE(nullptr, server_session);
  EXPECT_EQ("sensor-1", server_session->clientId());
  acks.clear();
  server_session->sink().publishAtLeastOnce(
      "commands/reboot", "now",
      [&](const VoidResult& result) { acks.push_back(result); });
  ASSERT_TRUE(runUntil([&]() { return !acks.empty(); }));
  EXPECT_FALSE(isError(acks[0]));
  EXPECT_EQ(std::vector<std::string>{"commands/reboot=now"},
            client_received_);
}

TEST_F(ServerTest, RouterDispatchesByTopic) {
  std::vector<std::string> hits;
  Router router;
  router.registerHandler("sensors/+/temp",
                         [&](const protocol::PublishMessage& message,
                             protocol::HandlerCompletion done) {
                           hits.push_back(message.topic());
                           done(makeVoidSuccess());
                         });
  createServer();
  server_->setPublishHandler(router.handler());

  connectPair("sensor-2");
  ASSERT_FALSE(isError(connect_results_[0]));

  int acked = 0;
  auto& sink = client_->session()->sink();
  sink.publishAtLeastOnce("sensors/a/temp", "1",
                          [&](const VoidResult&) { acked++; });
  sink.publishAtLeastOnce("sensors/a/humidity", "2",
                          [&](const VoidResult&) { acked++; });
  ASSERT_TRUE(runUntil([&]() { return acked == 2; }));
  EXPECT_EQ(std::vector<std::string>{"sensors/a/temp"}, hits);
}

TEST_F(ServerTest, RejectedClientIsRefused) {
  createServer();
  server_->setConnectHandler(
      [](const protocol::ConnectRequest&, protocol::ConnectCompletion done) {
        done(protocol::ConnectResponse::notAuthorized());
      });

  connectPair("intruder");
  ASSERT_TRUE(isError(connect_results_[0]));
  EXPECT_EQ(errors::CONNECTION_REFUSED, get<Error>(connect_results_[0]).code);
  ASSERT_TRUE(client_->connectCode().has_value());
  EXPECT_EQ(codec::ConnectCode::NotAuthorized, *client_->connectCode());

  ASSERT_TRUE(runUntil([this]() { return server_->connectionCount() == 0; }));
  EXPECT_TRUE(disconnects_.empty());
}

TEST_F(ServerTest, ClientDisconnectIsClean) {
  createServer();
  connectPair("sensor-3");
  ASSERT_FALSE(isError(connect_results_[0]));

  client_->disconnect();
  ASSERT_TRUE(runUntil([this]() { return server_->connectionCount() == 0; }));
  EXPECT_EQ(std::vector<std::string>{"sensor-3:clean"}, disconnects_);
}

TEST_F(ServerTest, ClientDropIsAnError) {
  createServer();
  connectPair("sensor-4");
  ASSERT_FALSE(isError(connect_results_[0]));

  client_->close();
  ASSERT_TRUE(runUntil([this]() { return server_->connectionCount() == 0; }));
  EXPECT_EQ(std::vector<std::string>{"sensor-4:error"}, disconnects_);
}

TEST_F(ServerTest, ListenAcceptsTcpClients) {
  createServer();
  server_->listen();
  ASSERT_NE(0, server_->port());

  client_ = makeClient("tcp-1");
  client_->connect("127.0.0.1", server_->port(),
                   [this](Result<client::ConnectResult> result) {
                     connect_results_.push_back(std::move(result));
                   });
  ASSERT_TRUE(runUntil([this]() { return !connect_results_.empty(); }));
  ASSERT_FALSE(isError(connect_results_[0]));
  EXPECT_FALSE(get<client::ConnectResult>(connect_results_[0]).session_present);
  EXPECT_EQ(1u, server_->connectionCount());
}

TEST_F(ServerTest, ConnectToClosedPortFails) {
  createServer();
  server_->listen();
  uint16_t port = server_->port();
  server_->shutdown();

  client_ = makeClient("tcp-2");
  client_->connect("127.0.0.1", port,
                   [this](Result<client::ConnectResult> result) {
                     connect_results_.push_back(std::move(result));
                   });
  ASSERT_TRUE(runUntil([this]() { return !connect_results_.empty(); }));
  EXPECT_TRUE(isError(connect_results_[0]));
  EXPECT_EQ(client::ClientState::Closed, client_->state());
}

TEST_F(ServerTest, ShutdownClosesConnections) {
  createServer();
  server_->listen();
  connectPair("sensor-5");
  ASSERT_FALSE(isError(connect_results_[0]));

  server_->shutdown();
  EXPECT_EQ(0u, server_->connectionCount());
  EXPECT_EQ(0, server_->port());
  EXPECT_EQ(std::vector<std::string>{"sensor-5:clean"}, disconnects_);

  ASSERT_TRUE(runUntil(
      [this]() { return client_->state() == client::ClientState::Closed; }));
}

TEST_F(ServerTest, DestructionWithLiveConnections) {
  createServer();
  connectPair("sensor-6");
  ASSERT_FALSE(isError(connect_results_[0]));

  server_.reset();
  ASSERT_TRUE(runUntil(
      [this]() { return client_->state() == client::ClientState::Closed; }));
}

}  // namespace
}  // namespace server
}  // namespace mqtt
