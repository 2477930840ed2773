#define MQTT_LOG_COMPONENT "server.router"

#include "mqtt/server/router.h"

#include <memory>
#include <utility>

#include "mqtt/logging/log_macros.h"

namespace mqtt {
namespace server {

Router::Router() {
  default_handler_ = [](const protocol::PublishMessage& message,
                        protocol::HandlerCompletion done) {
    MQTT_LOG(Warning, "Unknown topic {}", message.publishTopic());
    done(makeVoidSuccess());
  };
}

VoidResult Router::registerHandler(const std::string& filter,
                                   protocol::PublishHandler handler) {
  auto parsed = codec::TopicFilter::create(filter);
  if (isError(parsed)) {
    MQTT_LOG(Error, "Invalid route filter '{}': {}", filter,
             get<Error>(parsed).message);
    return makeVoidError(get<Error>(parsed));
  }
  routes_.push_back(
      Route{std::move(get<codec::TopicFilter>(parsed)), std::move(handler)});
  MQTT_LOG(Debug, "Registered route {}", filter);
  return makeVoidSuccess();
}

void Router::registerDefaultHandler(protocol::PublishHandler handler) {
  default_handler_ = std::move(handler);
}

protocol::PublishHandler Router::handler() const {
  auto router = std::make_shared<Router>(*this);
  return [router](const protocol::PublishMessage& message,
                  protocol::HandlerCompletion done) {
    router->route(message, std::move(done));
  };
}

void Router::route(const protocol::PublishMessage& message,
                   protocol::HandlerCompletion done) const {
  for (const auto& route : routes_) {
    if (route.filter.matches(message.topic())) {
      route.handler(message, std::move(done));
      return;
    }
  }
  default_handler_(message, std::move(done));
}

}  // namespace server
}  // namespace mqtt
