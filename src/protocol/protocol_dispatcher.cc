#define MQTT_LOG_COMPONENT "protocol.dispatcher"

#include "mqtt/protocol/protocol_dispatcher.h"

#include <atomic>
#include <exception>
#include <utility>

#include "mqtt/logging/log_macros.h"

namespace mqtt {
namespace protocol {

namespace {

// The SUBACK answers the SUBSCRIBE that arrived, one entry per filter, even
// when the handler hands back a request of another shape.
codec::SubscribeAck subscribeAckFor(uint16_t packet_id,
                                    size_t entries,
                                    const SubscribeRequest& request) {
  codec::SubscribeAck ack = request.toAck();
  if (ack.packet_id != packet_id || ack.status.size() != entries) {
    MQTT_LOG(Warning,
             "Subscribe handler returned {} outcomes for packet {}, "
             "expected {} for packet {}",
             ack.status.size(), ack.packet_id, entries, packet_id);
    ack.packet_id = packet_id;
    ack.status.resize(entries, codec::SubscribeReturnCode::Failure());
  }
  return ack;
}

}  // namespace

ProtocolDispatcher::ProtocolDispatcher(event::Dispatcher& dispatcher,
                                       session::SessionSharedPtr session,
                                       SessionHandlers handlers,
                                       ProtocolDispatcherConfig config)
    : dispatcher_(dispatcher),
      session_(std::move(session)),
      handlers_(withDefaults(std::move(handlers))),
      config_(std::move(config)),
      alive_(std::make_shared<bool>(true)) {}

ProtocolDispatcher::~ProtocolDispatcher() { stopped_ = true; }

void ProtocolDispatcher::setMaxInflight(size_t max_inflight) {
  config_.max_inflight = max_inflight;
  admitBacklog();
}

void ProtocolDispatcher::onPacket(codec::Packet packet) {
  if (stopped_) {
    return;
  }

  if (holds_alternative<codec::PingRequest>(packet)) {
    uint64_t seq = reserveSlot();
    fillSlot(seq, codec::Packet(codec::PingResponse{}));
    return;
  }

  if (holds_alternative<codec::Disconnect>(packet)) {
    MQTT_LOG(Debug, "DISCONNECT from {}", session_->clientId());
    stop();
    if (config_.close) {
      config_.close(nullopt);
    }
    return;
  }

  if (auto* ack = get_if<codec::PublishAck>(&packet)) {
    session_->sink().onPublishAck(ack->packet_id);
    return;
  }

  if (holds_alternative<codec::Publish>(packet) ||
      holds_alternative<codec::Subscribe>(packet) ||
      holds_alternative<codec::Unsubscribe>(packet)) {
    uint64_t seq = reserveSlot();
    admit(seq, std::move(packet));
    return;
  }

  MQTT_LOG(Debug, "Ignoring unexpected {} from {}", codec::packetName(packet),
           session_->clientId());
}

void ProtocolDispatcher::stop() {
  if (stopped_) {
    return;
  }
  stopped_ = true;
  if (!backlog_.empty()) {
    MQTT_LOG(Debug, "Dropping {} backlogged requests", backlog_.size());
  }
  backlog_.clear();
  replies_.clear();
  // Posted completions check this before touching the dispatcher
  alive_.reset();
}

// ===== Reply ordering =====

uint64_t ProtocolDispatcher::reserveSlot() {
  uint64_t seq = next_seq_++;
  replies_.push_back(ReplySlot{seq, false, nullopt});
  return seq;
}

void ProtocolDispatcher::fillSlot(uint64_t seq, optional<codec::Packet> reply) {
  if (replies_.empty() || seq < replies_.front().seq) {
    return;
  }
  size_t index = static_cast<size_t>(seq - replies_.front().seq);
  if (index >= replies_.size()) {
    return;
  }
  ReplySlot& slot = replies_[index];
  slot.ready = true;
  slot.reply = std::move(reply);
  flushReplies();
}

void ProtocolDispatcher::flushReplies() {
  while (!stopped_ && !replies_.empty() && replies_.front().ready) {
    optional<codec::Packet> reply = std::move(replies_.front().reply);
    replies_.pop_front();
    if (reply && config_.send_packet) {
      config_.send_packet(std::move(*reply));
    }
  }
}

// ===== Admission =====

void ProtocolDispatcher::admit(uint64_t seq, codec::Packet packet) {
  const bool capped =
      config_.max_inflight != 0 && inflight_ >= config_.max_inflight;
  if (capped || !backlog_.empty()) {
    backlog_.push_back(Backlogged{seq, std::move(packet)});
    MQTT_LOG(Debug, "In-flight limit {} reached, {} requests backlogged",
             config_.max_inflight, backlog_.size());
    return;
  }
  invoke(seq, std::move(packet));
}

void ProtocolDispatcher::admitBacklog() {
  while (!stopped_ && !backlog_.empty() &&
         (config_.max_inflight == 0 || inflight_ < config_.max_inflight)) {
    Backlogged next = std::move(backlog_.front());
    backlog_.pop_front();
    invoke(next.seq, std::move(next.packet));
  }
}

void ProtocolDispatcher::invoke(uint64_t seq, codec::Packet packet) {
  ++inflight_;
  auto complete = makeCompletion(seq);

  try {
    if (auto* publish = get_if<codec::Publish>(&packet)) {
      optional<uint16_t> id = publish->packet_id;
      PublishMessage message(std::move(*publish), session_);
      handlers_.publish(message, [complete, id](VoidResult result) {
        if (isError(result)) {
          complete(get<Error>(result));
          return;
        }
        if (id) {
          complete(make_optional(codec::Packet(codec::PublishAck{*id})));
        } else {
          complete(optional<codec::Packet>());
        }
      });
    } else if (auto* subscribe = get_if<codec::Subscribe>(&packet)) {
      uint16_t id = subscribe->packet_id;
      size_t entries = subscribe->topic_filters.size();
      SubscribeRequest request(std::move(*subscribe), session_);
      handlers_.subscribe(
          std::move(request),
          [complete, id, entries](Result<SubscribeRequest> result) {
            if (isError(result)) {
              complete(get<Error>(result));
              return;
            }
            complete(make_optional(codec::Packet(
                subscribeAckFor(id, entries, get<SubscribeRequest>(result)))));
          });
    } else if (auto* unsubscribe = get_if<codec::Unsubscribe>(&packet)) {
      uint16_t id = unsubscribe->packet_id;
      UnsubscribeRequest request(std::move(*unsubscribe), session_);
      handlers_.unsubscribe(request, [complete, id](VoidResult result) {
        if (isError(result)) {
          complete(get<Error>(result));
          return;
        }
        complete(make_optional(codec::Packet(codec::UnsubscribeAck{id})));
      });
    }
  } catch (const std::exception& e) {
    MQTT_LOG(Error, "Handler threw: {}", e.what());
    complete(Error(errors::HANDLER_ERROR, e.what()));
  }
}

std::function<void(ProtocolDispatcher::Outcome)>
ProtocolDispatcher::makeCompletion(uint64_t seq) {
  std::weak_ptr<bool> alive = alive_;
  auto fired = std::make_shared<std::atomic<bool>>(false);
  event::Dispatcher* dispatcher = &dispatcher_;

  return [this, alive, fired, dispatcher, seq](Outcome outcome) {
    if (fired->exchange(true)) {
      MQTT_LOG(Warning, "Handler completion invoked more than once");
      return;
    }
    if (alive.expired()) {
      return;
    }
    auto shared = std::make_shared<Outcome>(std::move(outcome));
    dispatcher->post([this, alive, seq, shared]() {
      if (alive.expired()) {
        return;
      }
      onComplete(seq, std::move(*shared));
    });
  };
}

void ProtocolDispatcher::onComplete(uint64_t seq, Outcome outcome) {
  if (stopped_) {
    return;
  }
  if (inflight_ > 0) {
    --inflight_;
  }

  if (isError(outcome)) {
    const Error& error = get<Error>(outcome);
    MQTT_LOG(Warning, "Handler failed for {}: {}", session_->clientId(),
             error.message);
    fail(errorCategory(error.code) == ErrorCategory::Handler
             ? error
             : Error(errors::HANDLER_ERROR, error.message));
    return;
  }

  fillSlot(seq, std::move(get<optional<codec::Packet>>(outcome)));
  admitBacklog();
}

void ProtocolDispatcher::fail(const Error& error) {
  stop();
  if (config_.close) {
    config_.close(error);
  }
}

}  // namespace protocol
}  // namespace mqtt
