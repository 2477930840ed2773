/**
 * @file packet.h
 * @brief MQTT 3.1.1 control packet model
 *
 * Every control packet is a plain value struct holding only its own fields.
 * Packet is a closed variant over all fourteen of them.
 */

#ifndef MQTT_CODEC_PACKET_H
#define MQTT_CODEC_PACKET_H

#include <cstdint>
#include <string>
#include <vector>

#include "mqtt/core/compat.h"

namespace mqtt {
namespace codec {

// Opaque binary data (payloads, passwords, will messages)
using Bytes = std::string;

enum class QoS : uint8_t {
  AtMostOnce = 0,
  AtLeastOnce = 1,
  ExactlyOnce = 2,
};

const char* qosToString(QoS qos);

// Return code carried by CONNACK
enum class ConnectCode : uint8_t {
  Accepted = 0,
  UnacceptableProtocolVersion = 1,
  IdentifierRejected = 2,
  ServiceUnavailable = 3,
  BadUserNameOrPassword = 4,
  NotAuthorized = 5,
  Reserved = 6,
};

// Human readable reason for a CONNACK return code
const char* connectCodeReason(ConnectCode code);

ConnectCode connectCodeFromByte(uint8_t value);

// Control packet type numbers (high nibble of the first header byte)
namespace packet_type {
constexpr uint8_t CONNECT = 1;
constexpr uint8_t CONNACK = 2;
constexpr uint8_t PUBLISH = 3;
constexpr uint8_t PUBACK = 4;
constexpr uint8_t PUBREC = 5;
constexpr uint8_t PUBREL = 6;
constexpr uint8_t PUBCOMP = 7;
constexpr uint8_t SUBSCRIBE = 8;
constexpr uint8_t SUBACK = 9;
constexpr uint8_t UNSUBSCRIBE = 10;
constexpr uint8_t UNSUBACK = 11;
constexpr uint8_t PINGREQ = 12;
constexpr uint8_t PINGRESP = 13;
constexpr uint8_t DISCONNECT = 14;
}  // namespace packet_type

// CONNECT flag byte layout
namespace connect_flags {
constexpr uint8_t RESERVED = 0x01;
constexpr uint8_t CLEAN_SESSION = 0x02;
constexpr uint8_t WILL = 0x04;
constexpr uint8_t WILL_QOS = 0x18;
constexpr uint8_t WILL_RETAIN = 0x20;
constexpr uint8_t PASSWORD = 0x40;
constexpr uint8_t USERNAME = 0x80;
}  // namespace connect_flags

constexpr uint8_t MQTT_LEVEL_3_1_1 = 4;

struct LastWill {
  QoS qos{QoS::AtMostOnce};
  bool retain{false};
  std::string topic;
  Bytes message;
};

struct Connect {
  uint8_t protocol_level{MQTT_LEVEL_3_1_1};
  bool clean_session{false};
  // Seconds, 0 disables keep-alive
  uint16_t keep_alive{0};
  std::string client_id;
  optional<LastWill> last_will;
  optional<std::string> username;
  optional<Bytes> password;
};

struct ConnectAck {
  bool session_present{false};
  ConnectCode return_code{ConnectCode::Accepted};
};

struct Publish {
  bool dup{false};
  bool retain{false};
  QoS qos{QoS::AtMostOnce};
  std::string topic;
  // Present iff qos != AtMostOnce
  optional<uint16_t> packet_id;
  Bytes payload;
};

struct PublishAck {
  uint16_t packet_id{0};
};

struct PublishReceived {
  uint16_t packet_id{0};
};

struct PublishRelease {
  uint16_t packet_id{0};
};

struct PublishComplete {
  uint16_t packet_id{0};
};

struct SubscribeTopic {
  std::string filter;
  QoS qos{QoS::AtMostOnce};
};

struct Subscribe {
  uint16_t packet_id{0};
  std::vector<SubscribeTopic> topic_filters;
};

// Per-entry SUBACK outcome: granted QoS or failure (0x80 on the wire)
class SubscribeReturnCode {
 public:
  SubscribeReturnCode() = default;

  static SubscribeReturnCode Success(QoS qos) {
    return SubscribeReturnCode(qos);
  }
  static SubscribeReturnCode Failure() { return SubscribeReturnCode(); }

  bool isSuccess() const { return granted_.has_value(); }
  bool isFailure() const { return !granted_.has_value(); }

  // Only meaningful when isSuccess()
  QoS grantedQoS() const { return granted_.value_or(QoS::AtMostOnce); }

  uint8_t toByte() const {
    return granted_ ? static_cast<uint8_t>(*granted_) : 0x80;
  }

  bool operator==(const SubscribeReturnCode& other) const {
    return granted_ == other.granted_;
  }
  bool operator!=(const SubscribeReturnCode& other) const {
    return !(*this == other);
  }

 private:
  explicit SubscribeReturnCode(QoS qos) : granted_(qos) {}

  optional<QoS> granted_;
};

struct SubscribeAck {
  uint16_t packet_id{0};
  std::vector<SubscribeReturnCode> status;
};

struct Unsubscribe {
  uint16_t packet_id{0};
  std::vector<std::string> topic_filters;
};

struct UnsubscribeAck {
  uint16_t packet_id{0};
};

struct PingRequest {};
struct PingResponse {};
struct Disconnect {};

using Packet = variant<Connect,
                       ConnectAck,
                       Publish,
                       PublishAck,
                       PublishReceived,
                       PublishRelease,
                       PublishComplete,
                       Subscribe,
                       SubscribeAck,
                       Unsubscribe,
                       UnsubscribeAck,
                       PingRequest,
                       PingResponse,
                       Disconnect>;

// Decoded first byte plus remaining length
struct FixedHeader {
  uint8_t packet_type{0};
  uint8_t packet_flags{0};
  uint32_t remaining_length{0};
};

// Type nibble for the packet
uint8_t packetType(const Packet& packet);

// Flags nibble for the packet
uint8_t packetFlags(const Packet& packet);

const char* packetName(const Packet& packet);

// ===== Equality =====

bool operator==(const LastWill& a, const LastWill& b);
bool operator==(const Connect& a, const Connect& b);
bool operator==(const ConnectAck& a, const ConnectAck& b);
bool operator==(const Publish& a, const Publish& b);
bool operator==(const PublishAck& a, const PublishAck& b);
bool operator==(const PublishReceived& a, const PublishReceived& b);
bool operator==(const PublishRelease& a, const PublishRelease& b);
bool operator==(const PublishComplete& a, const PublishComplete& b);
bool operator==(const SubscribeTopic& a, const SubscribeTopic& b);
bool operator==(const Subscribe& a, const Subscribe& b);
bool operator==(const SubscribeAck& a, const SubscribeAck& b);
bool operator==(const Unsubscribe& a, const Unsubscribe& b);
bool operator==(const UnsubscribeAck& a, const UnsubscribeAck& b);
bool operator==(const PingRequest&, const PingRequest&);
bool operator==(const PingResponse&, const PingResponse&);
bool operator==(const Disconnect&, const Disconnect&);

bool operator==(const FixedHeader& a, const FixedHeader& b);

}  // namespace codec
}  // namespace mqtt

#endif  // MQTT_CODEC_PACKET_H
