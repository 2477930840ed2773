/**
 * MQTT Example Server
 *
 * Accepts MQTT 3.1.1 clients and demonstrates:
 * - Loading the server configuration from a JSON or YAML file
 * - A connect handler that checks credentials and attaches session state
 * - Topic routing of inbound publishes
 * - Granting subscriptions and echoing publishes back with QoS 1
 *
 * Usage: mqtt_example_server [config.yaml]
 */

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "mqtt/config/server_config.h"
#include "mqtt/event/event_loop.h"
#include "mqtt/logging/logger_registry.h"
#include "mqtt/server/router.h"
#include "mqtt/server/server.h"

namespace mqtt {
namespace examples {

struct DeviceState {
  std::string client_id;
  size_t messages{0};
};

void configureHandlers(server::Server& server) {
  server.setConnectHandler([](const protocol::ConnectRequest& request,
                              protocol::ConnectCompletion done) {
    if (request.username() && *request.username() == "banned") {
      done(protocol::ConnectResponse::notAuthorized());
      return;
    }
    auto state = std::make_shared<DeviceState>();
    state->client_id = request.clientId();
    done(protocol::ConnectResponse::accept(false).state(state));
  });

  server::Router router;
  auto registered = router.registerHandler(
      "devices/+/telemetry",
      [](const protocol::PublishMessage& message,
         protocol::HandlerCompletion done) {
        auto state = message.session().state<DeviceState>();
        state->messages++;
        std::cout << "[" << state->client_id << "] " << message.topic()
                  << ": " << message.payload() << std::endl;
        // Echo back to subscribers of echo/#
        message.sink().publishAtLeastOnce(
            "echo/" + message.topic(), message.payload(),
            [](const VoidResult& result) {
              if (isError(result)) {
                std::cerr << "Echo not acknowledged: "
                          << get<Error>(result).message << std::endl;
              }
            });
        done(makeVoidSuccess());
      });
  if (isError(registered)) {
    std::cerr << "ERROR: " << get<Error>(registered).message << std::endl;
  }
  server.setPublishHandler(router.handler());

  server.setSubscribeHandler([](protocol::SubscribeRequest request,
                                protocol::SubscribeCompletion done) {
    for (size_t i = 0; i < request.size(); ++i) {
      request.grantRequested(i);
    }
    done(std::move(request));
  });

  server.setDisconnectHandler(
      [](const session::SessionSharedPtr& session, bool error) {
        auto state = session->state<DeviceState>();
        std::cout << "Client " << session->clientId() << " disconnected"
                  << (error ? " with error" : "") << " after "
                  << (state ? state->messages : 0) << " messages"
                  << std::endl;
      });
}

}  // namespace examples
}  // namespace mqtt

int main(int argc, char** argv) {
  using namespace mqtt;

  config::ServerConfig config;
  if (argc > 1) {
    try {
      config = config::loadServerConfigFile(argv[1]);
    } catch (const std::exception& e) {
      std::cerr << "ERROR: Failed to load config: " << e.what() << std::endl;
      return 1;
    }
  }

  auto& registry = logging::LoggerRegistry::instance();
  registry.setGlobalLevel(config.log_level);
  try {
    registry.setDefaultSink(logging::createSink(config.logSink()));
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  }

  auto dispatcher =
      event::createLibeventDispatcherFactory()->createDispatcher("mqtt");

  server::Server server(*dispatcher, config);
  examples::configureHandlers(server);

  try {
    server.listen();
  } catch (const std::exception& e) {
    std::cerr << "ERROR: Failed to start listener: " << e.what() << std::endl;
    return 1;
  }
  std::cout << "Listening on " << config.address << ":" << server.port()
            << std::endl;

  auto sigint = dispatcher->listenForSignal(SIGINT, [&]() {
    std::cout << "Shutting down" << std::endl;
    server.shutdown();
    dispatcher->exit();
  });
  auto sigterm = dispatcher->listenForSignal(SIGTERM, [&]() {
    server.shutdown();
    dispatcher->exit();
  });

  dispatcher->run(event::RunType::RunUntilExit);
  return 0;
}
