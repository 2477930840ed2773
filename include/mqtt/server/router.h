#ifndef MQTT_SERVER_ROUTER_H
#define MQTT_SERVER_ROUTER_H

#include <string>
#include <vector>

#include "mqtt/codec/topic.h"
#include "mqtt/core/result.h"
#include "mqtt/protocol/handlers.h"

namespace mqtt {
namespace server {

/**
 * Routes inbound PUBLISH packets to handlers by topic filter.
 *
 * Filters are tried in registration order against the topic with any
 * `?query` suffix removed; the first match wins. Unmatched publishes go to
 * the default handler, which acknowledges and logs a warning.
 */
class Router {
 public:
  Router();

  /**
   * Register a handler for a topic filter such as "sensors/+/temp".
   * Returns an error when the filter does not parse.
   */
  VoidResult registerHandler(const std::string& filter,
                             protocol::PublishHandler handler);

  void registerDefaultHandler(protocol::PublishHandler handler);

  size_t routeCount() const { return routes_.size(); }

  // The router as a single publish handler
  protocol::PublishHandler handler() const;

  void route(const protocol::PublishMessage& message,
             protocol::HandlerCompletion done) const;

 private:
  struct Route {
    codec::TopicFilter filter;
    protocol::PublishHandler handler;
  };

  std::vector<Route> routes_;
  protocol::PublishHandler default_handler_;
};

}  // namespace server
}  // namespace mqtt

#endif  // MQTT_SERVER_ROUTER_H
