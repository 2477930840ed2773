/**
 * @file protocol_dispatcher.h
 * @brief Steady-state packet routing for one MQTT connection
 *
 * Routes decoded packets to the application handlers and emits replies:
 * - PINGREQ: PINGRESP
 * - DISCONNECT: stop, nothing emitted
 * - PUBLISH: publish handler, then PUBACK when the packet carried an id
 * - PUBACK: resolved against the session sink
 * - SUBSCRIBE: subscribe handler, then one SUBACK in request order
 * - UNSUBSCRIBE: unsubscribe handler, then UNSUBACK
 *
 * Replies leave in the order their requests arrived, whatever order the
 * handlers complete in. At most max_inflight handler invocations are
 * outstanding; further requests wait in a backlog.
 *
 * All methods run on the dispatcher thread. Handler completions may come
 * from any thread and are posted back.
 */

#ifndef MQTT_PROTOCOL_PROTOCOL_DISPATCHER_H
#define MQTT_PROTOCOL_PROTOCOL_DISPATCHER_H

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>

#include "mqtt/codec/packet.h"
#include "mqtt/core/result.h"
#include "mqtt/event/event_loop.h"
#include "mqtt/protocol/handlers.h"
#include "mqtt/session/session.h"

namespace mqtt {
namespace protocol {

constexpr size_t DEFAULT_MAX_INFLIGHT = 15;

struct ProtocolDispatcherConfig {
  // Concurrently outstanding handler invocations
  size_t max_inflight{DEFAULT_MAX_INFLIGHT};

  // Encodes and sends one reply
  std::function<void(codec::Packet)> send_packet;

  // Requests connection close: nullopt for DISCONNECT, an Error otherwise
  std::function<void(const optional<Error>&)> close;
};

class ProtocolDispatcher {
 public:
  ProtocolDispatcher(event::Dispatcher& dispatcher,
                     session::SessionSharedPtr session,
                     SessionHandlers handlers,
                     ProtocolDispatcherConfig config);
  ~ProtocolDispatcher();

  ProtocolDispatcher(const ProtocolDispatcher&) = delete;
  ProtocolDispatcher& operator=(const ProtocolDispatcher&) = delete;

  void onPacket(codec::Packet packet);

  /**
   * Stop admitting work. Backlogged requests are dropped and late handler
   * completions are ignored.
   */
  void stop();

  bool stopped() const { return stopped_; }

  size_t inflight() const { return inflight_; }
  size_t backlog() const { return backlog_.size(); }
  // Requests whose reply has not been emitted yet
  size_t pendingReplies() const { return replies_.size(); }

  size_t maxInflight() const { return config_.max_inflight; }
  void setMaxInflight(size_t max_inflight);

 private:
  // Reply slot, one per request that expects a reply
  struct ReplySlot {
    uint64_t seq;
    bool ready{false};
    optional<codec::Packet> reply;
  };

  struct Backlogged {
    uint64_t seq;
    codec::Packet packet;
  };

  using Outcome = Result<optional<codec::Packet>>;

  uint64_t reserveSlot();
  void fillSlot(uint64_t seq, optional<codec::Packet> reply);
  void flushReplies();

  void admit(uint64_t seq, codec::Packet packet);
  void admitBacklog();
  void invoke(uint64_t seq, codec::Packet packet);

  // Completion callable from any thread; runs onComplete on this thread
  std::function<void(Outcome)> makeCompletion(uint64_t seq);
  void onComplete(uint64_t seq, Outcome outcome);

  void fail(const Error& error);

  event::Dispatcher& dispatcher_;
  session::SessionSharedPtr session_;
  SessionHandlers handlers_;
  ProtocolDispatcherConfig config_;

  std::deque<ReplySlot> replies_;
  std::deque<Backlogged> backlog_;
  uint64_t next_seq_{0};
  size_t inflight_{0};
  bool stopped_{false};

  // Expires with this object so posted completions can detect it
  std::shared_ptr<bool> alive_;
};

}  // namespace protocol
}  // namespace mqtt

#endif  // MQTT_PROTOCOL_PROTOCOL_DISPATCHER_H
