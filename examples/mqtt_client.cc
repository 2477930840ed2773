/**
 * MQTT Example Client
 *
 * Connects to a server, publishes a few QoS 1 messages and prints every
 * publish the server sends back before disconnecting.
 *
 * Usage: mqtt_example_client [host] [port] [client_id]
 */

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "mqtt/client/client.h"
#include "mqtt/event/event_loop.h"

int main(int argc, char** argv) {
  using namespace mqtt;

  std::string host = argc > 1 ? argv[1] : "127.0.0.1";
  uint16_t port = argc > 2 ? static_cast<uint16_t>(std::atoi(argv[2])) : 1883;
  std::string client_id = argc > 3 ? argv[3] : "example-client";

  auto dispatcher =
      event::createLibeventDispatcherFactory()->createDispatcher("client");

  const int total = 5;
  auto acked = std::make_shared<int>(0);

  auto client =
      client::ClientBuilder(client_id)
          .keepAlive(30)
          .handshakeTimeout(std::chrono::seconds(5))
          .publishHandler([](const protocol::PublishMessage& message,
                             protocol::HandlerCompletion done) {
            std::cout << "<- " << message.topic() << ": "
                      << message.payload() << std::endl;
            done(makeVoidSuccess());
          })
          .disconnectHandler(
              [&](const session::SessionSharedPtr&, bool error) {
                std::cout << "Disconnected" << (error ? " with error" : "")
                          << std::endl;
                dispatcher->exit();
              })
          .build(*dispatcher);

  client->connect(host, port, [&](Result<client::ConnectResult> result) {
    if (isError(result)) {
      std::cerr << "ERROR: " << get<Error>(result).message << std::endl;
      dispatcher->exit();
      return;
    }

    auto session = get<client::ConnectResult>(result).session;
    std::string topic = "devices/" + client_id + "/telemetry";
    for (int i = 0; i < total; ++i) {
      session->sink().publishAtLeastOnce(
          topic, "{\"seq\":" + std::to_string(i) + "}",
          [&, acked](const VoidResult& published) {
            if (isError(published)) {
              std::cerr << "Publish failed: "
                        << get<Error>(published).message << std::endl;
              return;
            }
            if (++*acked == total) {
              std::cout << "All " << total << " messages acknowledged"
                        << std::endl;
              client->disconnect();
            }
          });
    }
  });

  dispatcher->run(event::RunType::RunUntilExit);
  return 0;
}
