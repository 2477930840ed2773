/**
 * @file sink.h
 * @brief Outbound publish path of one MQTT connection
 *
 * The sink allocates packet identifiers for QoS 1 publishes and resolves
 * their completions as PUBACKs arrive. Acks must arrive in issuance order:
 * an ack that does not match the oldest outstanding id invalidates the
 * session and closes the connection.
 *
 * Publishing is allowed from any thread. The pending queue and the id
 * counter are guarded by one mutex, and frames are handed to the writer
 * under that mutex so wire order equals id order.
 */

#ifndef MQTT_SESSION_SINK_H
#define MQTT_SESSION_SINK_H

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "mqtt/codec/packet.h"
#include "mqtt/core/result.h"

namespace mqtt {
namespace session {

// Resolved with success on PUBACK, or with an Error when the connection
// goes away first.
using PublishCompletion = std::function<void(const VoidResult&)>;

class Sink {
 public:
  // Hands a packet to the connection for encoding and sending. Runs under
  // the sink mutex, so it must not close the connection synchronously.
  using PacketWriter = std::function<void(codec::Packet)>;

  // Asks the connection to close; carries the error for fatal closes
  using CloseRequest = std::function<void(const optional<Error>&)>;

  Sink(PacketWriter writer, CloseRequest close_request);
  ~Sink();

  Sink(const Sink&) = delete;
  Sink& operator=(const Sink&) = delete;

  /**
   * Fire-and-forget publish with QoS 0. Ignored once closed, or when the
   * topic holds a wildcard.
   */
  void publishAtMostOnce(const std::string& topic,
                         const codec::Bytes& payload,
                         bool dup = false);

  /**
   * QoS 1 publish. Allocates the next non-zero packet id, queues the
   * completion and sends the frame.
   *
   * @return the packet id used, or nullopt if the sink is closed or the
   * topic holds a wildcard (the completion has then already been failed).
   */
  optional<uint16_t> publishAtLeastOnce(const std::string& topic,
                                        const codec::Bytes& payload,
                                        bool dup,
                                        PublishCompletion completion);

  optional<uint16_t> publishAtLeastOnce(const std::string& topic,
                                        const codec::Bytes& payload,
                                        PublishCompletion completion) {
    return publishAtLeastOnce(topic, payload, false, std::move(completion));
  }

  /**
   * Resolve the oldest outstanding publish. A mismatched id or an empty
   * queue closes the connection with ACK_MISMATCH.
   */
  void onPublishAck(uint16_t packet_id);

  // Close the connection normally
  void close();

  /**
   * Mark the sink closed and fail every outstanding completion with
   * `error`. Called by the connection when it tears down.
   */
  void invalidate(const Error& error);

  bool isOpen() const;
  size_t pendingCount() const;

 private:
  using PendingEntry = std::pair<uint16_t, PublishCompletion>;

  uint16_t nextPacketId();
  void failAll(std::deque<PendingEntry>& pending, const Error& error);

  PacketWriter writer_;
  CloseRequest close_request_;

  mutable std::mutex mutex_;
  uint16_t last_id_{0};
  std::deque<PendingEntry> pending_;
  bool closed_{false};
};

using SinkSharedPtr = std::shared_ptr<Sink>;

}  // namespace session
}  // namespace mqtt

#endif  // MQTT_SESSION_SINK_H
