#define MQTT_LOG_COMPONENT "session.sink"

#include "mqtt/session/sink.h"

#include "mqtt/codec/topic.h"
#include "mqtt/logging/log_macros.h"

namespace mqtt {
namespace session {

Sink::Sink(PacketWriter writer, CloseRequest close_request)
    : writer_(std::move(writer)), close_request_(std::move(close_request)) {}

Sink::~Sink() {
  std::deque<PendingEntry> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    pending.swap(pending_);
  }
  failAll(pending, Error(errors::DISCONNECTED, "Session destroyed"));
}

uint16_t Sink::nextPacketId() {
  ++last_id_;
  if (last_id_ == 0) {
    last_id_ = 1;
  }
  return last_id_;
}

void Sink::publishAtMostOnce(const std::string& topic,
                             const codec::Bytes& payload,
                             bool dup) {
  codec::Publish publish;
  publish.dup = dup;
  publish.retain = false;
  publish.qos = codec::QoS::AtMostOnce;
  publish.topic = topic;
  publish.payload = payload;

  if (isError(codec::validateTopicName(topic))) {
    MQTT_LOG(Warning, "Dropping QoS 0 publish to {}: wildcard in topic",
             topic);
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    MQTT_LOG(Debug, "Dropping QoS 0 publish to {}: session closed", topic);
    return;
  }
  MQTT_LOG(Debug, "Publish (QoS 0) to {}", topic);
  writer_(codec::Packet(std::move(publish)));
}

optional<uint16_t> Sink::publishAtLeastOnce(const std::string& topic,
                                            const codec::Bytes& payload,
                                            bool dup,
                                            PublishCompletion completion) {
  VoidResult name = codec::validateTopicName(topic);
  if (isError(name)) {
    if (completion) {
      completion(name);
    }
    return nullopt;
  }

  std::unique_lock<std::mutex> lock(mutex_);
  if (closed_) {
    lock.unlock();
    if (completion) {
      completion(
          makeVoidError(Error(errors::DISCONNECTED, "Session is closed")));
    }
    return nullopt;
  }

  uint16_t id = nextPacketId();
  pending_.emplace_back(id, std::move(completion));

  codec::Publish publish;
  publish.dup = dup;
  publish.retain = false;
  publish.qos = codec::QoS::AtLeastOnce;
  publish.topic = topic;
  publish.packet_id = id;
  publish.payload = payload;

  MQTT_LOG(Debug, "Publish (QoS 1) to {} with id {}", topic, id);
  writer_(codec::Packet(std::move(publish)));
  return id;
}

void Sink::onPublishAck(uint16_t packet_id) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (closed_) {
    return;
  }

  if (pending_.empty()) {
    MQTT_LOG(Warning, "Unexpected PUBACK with id {}", packet_id);
    closed_ = true;
    lock.unlock();
    if (close_request_) {
      close_request_(Error(errors::ACK_MISMATCH,
                           "Unexpected PUBACK " + std::to_string(packet_id)));
    }
    return;
  }

  PendingEntry front = std::move(pending_.front());
  pending_.pop_front();

  if (front.first != packet_id) {
    MQTT_LOG(Warning, "PUBACK out of order, expected {}, got {}", front.first,
             packet_id);
    closed_ = true;
    std::deque<PendingEntry> pending;
    pending.swap(pending_);
    pending.push_front(std::move(front));
    lock.unlock();

    Error error(errors::ACK_MISMATCH,
                "PUBACK out of order, expected " +
                    std::to_string(pending.front().first) + ", got " +
                    std::to_string(packet_id));
    failAll(pending, error);
    if (close_request_) {
      close_request_(error);
    }
    return;
  }

  lock.unlock();
  MQTT_LOG(Debug, "Ack publish with id {}", packet_id);
  if (front.second) {
    front.second(makeVoidSuccess());
  }
}

void Sink::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
  }
  if (close_request_) {
    close_request_(nullopt);
  }
}

void Sink::invalidate(const Error& error) {
  std::deque<PendingEntry> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    pending.swap(pending_);
  }
  if (!pending.empty()) {
    MQTT_LOG(Debug, "Failing {} pending publishes: {}", pending.size(),
             error.message);
  }
  failAll(pending, error);
}

bool Sink::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !closed_;
}

size_t Sink::pendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

void Sink::failAll(std::deque<PendingEntry>& pending, const Error& error) {
  const VoidResult result = makeVoidError(error);
  for (auto& entry : pending) {
    if (entry.second) {
      entry.second(result);
    }
  }
  pending.clear();
}

}  // namespace session
}  // namespace mqtt
