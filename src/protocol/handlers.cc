#define MQTT_LOG_COMPONENT "protocol.handlers"

#include "mqtt/protocol/handlers.h"

#include <utility>

#include "mqtt/logging/log_macros.h"

namespace mqtt {
namespace protocol {

PublishMessage::PublishMessage(codec::Publish packet,
                               session::SessionSharedPtr session)
    : packet_(std::move(packet)), session_(std::move(session)) {
  auto pos = packet_.topic.find('?');
  if (pos == std::string::npos) {
    topic_ = packet_.topic;
  } else {
    topic_ = packet_.topic.substr(0, pos);
    query_ = packet_.topic.substr(pos + 1);
  }
}

Result<nlohmann::json> PublishMessage::payloadJson() const {
  auto json = nlohmann::json::parse(packet_.payload, nullptr, false);
  if (json.is_discarded()) {
    return Error(errors::HANDLER_ERROR, "Payload is not valid JSON");
  }
  return json;
}

SubscribeRequest::SubscribeRequest(codec::Subscribe packet,
                                   session::SessionSharedPtr session)
    : packet_(std::move(packet)),
      outcomes_(packet_.topic_filters.size(),
                codec::SubscribeReturnCode::Failure()),
      session_(std::move(session)) {}

codec::SubscribeAck SubscribeRequest::toAck() const {
  codec::SubscribeAck ack;
  ack.packet_id = packet_.packet_id;
  ack.status = outcomes_;
  return ack;
}

PublishHandler defaultPublishHandler() {
  return [](const PublishMessage& message, HandlerCompletion done) {
    MQTT_LOG(Warning, "MQTT Publish is not implemented, dropping message to {}",
             message.publishTopic());
    done(makeVoidSuccess());
  };
}

SubscribeHandler defaultSubscribeHandler() {
  return [](SubscribeRequest request, SubscribeCompletion done) {
    MQTT_LOG(Warning, "MQTT Subscribe is not implemented");
    for (size_t i = 0; i < request.size(); ++i) {
      request.fail(i);
    }
    done(std::move(request));
  };
}

UnsubscribeHandler defaultUnsubscribeHandler() {
  return [](const UnsubscribeRequest&, HandlerCompletion done) {
    MQTT_LOG(Warning, "MQTT Unsubscribe is not implemented");
    done(makeVoidSuccess());
  };
}

SessionHandlers withDefaults(SessionHandlers handlers) {
  if (!handlers.publish) {
    handlers.publish = defaultPublishHandler();
  }
  if (!handlers.subscribe) {
    handlers.subscribe = defaultSubscribeHandler();
  }
  if (!handlers.unsubscribe) {
    handlers.unsubscribe = defaultUnsubscribeHandler();
  }
  return handlers;
}

}  // namespace protocol
}  // namespace mqtt
