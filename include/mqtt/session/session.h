#ifndef MQTT_SESSION_SESSION_H
#define MQTT_SESSION_SESSION_H

#include <memory>
#include <string>
#include <utility>

#include "mqtt/codec/packet.h"
#include "mqtt/session/sink.h"

namespace mqtt {
namespace session {

/**
 * Per-connection session handed to every handler after CONNECT.
 *
 * Carries the identity from the CONNECT packet, the outbound sink, and an
 * optional application state object chosen by the connect handler.
 */
class Session {
 public:
  Session(std::string client_id,
          optional<std::string> username,
          SinkSharedPtr sink,
          std::shared_ptr<void> state = nullptr)
      : client_id_(std::move(client_id)),
        username_(std::move(username)),
        sink_(std::move(sink)),
        state_(std::move(state)) {}

  const std::string& clientId() const { return client_id_; }
  const optional<std::string>& username() const { return username_; }

  Sink& sink() const { return *sink_; }
  const SinkSharedPtr& sinkPtr() const { return sink_; }

  // Application state attached by the connect handler
  template <typename T>
  std::shared_ptr<T> state() const {
    return std::static_pointer_cast<T>(state_);
  }
  bool hasState() const { return state_ != nullptr; }

 private:
  std::string client_id_;
  optional<std::string> username_;
  SinkSharedPtr sink_;
  std::shared_ptr<void> state_;
};

using SessionSharedPtr = std::shared_ptr<Session>;

}  // namespace session
}  // namespace mqtt

#endif  // MQTT_SESSION_SESSION_H
