#include "mqtt/codec/packet.h"

namespace mqtt {
namespace codec {

const char* qosToString(QoS qos) {
  switch (qos) {
    case QoS::AtMostOnce: return "AtMostOnce";
    case QoS::AtLeastOnce: return "AtLeastOnce";
    case QoS::ExactlyOnce: return "ExactlyOnce";
  }
  return "Unknown";
}

const char* connectCodeReason(ConnectCode code) {
  switch (code) {
    case ConnectCode::Accepted:
      return "Connection Accepted";
    case ConnectCode::UnacceptableProtocolVersion:
      return "Connection Refused, unacceptable protocol version";
    case ConnectCode::IdentifierRejected:
      return "Connection Refused, identifier rejected";
    case ConnectCode::ServiceUnavailable:
      return "Connection Refused, Server unavailable";
    case ConnectCode::BadUserNameOrPassword:
      return "Connection Refused, bad user name or password";
    case ConnectCode::NotAuthorized:
      return "Connection Refused, not authorized";
    case ConnectCode::Reserved:
      return "Connection Refused";
  }
  return "Connection Refused";
}

ConnectCode connectCodeFromByte(uint8_t value) {
  if (value >= static_cast<uint8_t>(ConnectCode::Reserved)) {
    return ConnectCode::Reserved;
  }
  return static_cast<ConnectCode>(value);
}

namespace {

struct TypeVisitor {
  uint8_t operator()(const Connect&) const { return packet_type::CONNECT; }
  uint8_t operator()(const ConnectAck&) const { return packet_type::CONNACK; }
  uint8_t operator()(const Publish&) const { return packet_type::PUBLISH; }
  uint8_t operator()(const PublishAck&) const { return packet_type::PUBACK; }
  uint8_t operator()(const PublishReceived&) const {
    return packet_type::PUBREC;
  }
  uint8_t operator()(const PublishRelease&) const {
    return packet_type::PUBREL;
  }
  uint8_t operator()(const PublishComplete&) const {
    return packet_type::PUBCOMP;
  }
  uint8_t operator()(const Subscribe&) const { return packet_type::SUBSCRIBE; }
  uint8_t operator()(const SubscribeAck&) const { return packet_type::SUBACK; }
  uint8_t operator()(const Unsubscribe&) const {
    return packet_type::UNSUBSCRIBE;
  }
  uint8_t operator()(const UnsubscribeAck&) const {
    return packet_type::UNSUBACK;
  }
  uint8_t operator()(const PingRequest&) const { return packet_type::PINGREQ; }
  uint8_t operator()(const PingResponse&) const {
    return packet_type::PINGRESP;
  }
  uint8_t operator()(const Disconnect&) const {
    return packet_type::DISCONNECT;
  }
};

}  // namespace

uint8_t packetType(const Packet& packet) {
  return visit(TypeVisitor{}, packet);
}

uint8_t packetFlags(const Packet& packet) {
  if (auto* publish = get_if<Publish>(&packet)) {
    uint8_t flags = static_cast<uint8_t>(static_cast<uint8_t>(publish->qos)
                                         << 1);
    if (publish->dup) flags |= 0x08;
    if (publish->retain) flags |= 0x01;
    return flags;
  }
  if (holds_alternative<PublishRelease>(packet) ||
      holds_alternative<Subscribe>(packet) ||
      holds_alternative<Unsubscribe>(packet)) {
    return 0x02;
  }
  return 0;
}

const char* packetName(const Packet& packet) {
  switch (packetType(packet)) {
    case packet_type::CONNECT: return "CONNECT";
    case packet_type::CONNACK: return "CONNACK";
    case packet_type::PUBLISH: return "PUBLISH";
    case packet_type::PUBACK: return "PUBACK";
    case packet_type::PUBREC: return "PUBREC";
    case packet_type::PUBREL: return "PUBREL";
    case packet_type::PUBCOMP: return "PUBCOMP";
    case packet_type::SUBSCRIBE: return "SUBSCRIBE";
    case packet_type::SUBACK: return "SUBACK";
    case packet_type::UNSUBSCRIBE: return "UNSUBSCRIBE";
    case packet_type::UNSUBACK: return "UNSUBACK";
    case packet_type::PINGREQ: return "PINGREQ";
    case packet_type::PINGRESP: return "PINGRESP";
    case packet_type::DISCONNECT: return "DISCONNECT";
  }
  return "UNKNOWN";
}

// ===== Equality =====

bool operator==(const LastWill& a, const LastWill& b) {
  return a.qos == b.qos && a.retain == b.retain && a.topic == b.topic &&
         a.message == b.message;
}

bool operator==(const Connect& a, const Connect& b) {
  return a.protocol_level == b.protocol_level &&
         a.clean_session == b.clean_session && a.keep_alive == b.keep_alive &&
         a.client_id == b.client_id && a.last_will == b.last_will &&
         a.username == b.username && a.password == b.password;
}

bool operator==(const ConnectAck& a, const ConnectAck& b) {
  return a.session_present == b.session_present &&
         a.return_code == b.return_code;
}

bool operator==(const Publish& a, const Publish& b) {
  return a.dup == b.dup && a.retain == b.retain && a.qos == b.qos &&
         a.topic == b.topic && a.packet_id == b.packet_id &&
         a.payload == b.payload;
}

bool operator==(const PublishAck& a, const PublishAck& b) {
  return a.packet_id == b.packet_id;
}

bool operator==(const PublishReceived& a, const PublishReceived& b) {
  return a.packet_id == b.packet_id;
}

bool operator==(const PublishRelease& a, const PublishRelease& b) {
  return a.packet_id == b.packet_id;
}

bool operator==(const PublishComplete& a, const PublishComplete& b) {
  return a.packet_id == b.packet_id;
}

bool operator==(const SubscribeTopic& a, const SubscribeTopic& b) {
  return a.filter == b.filter && a.qos == b.qos;
}

bool operator==(const Subscribe& a, const Subscribe& b) {
  return a.packet_id == b.packet_id && a.topic_filters == b.topic_filters;
}

bool operator==(const SubscribeAck& a, const SubscribeAck& b) {
  return a.packet_id == b.packet_id && a.status == b.status;
}

bool operator==(const Unsubscribe& a, const Unsubscribe& b) {
  return a.packet_id == b.packet_id && a.topic_filters == b.topic_filters;
}

bool operator==(const UnsubscribeAck& a, const UnsubscribeAck& b) {
  return a.packet_id == b.packet_id;
}

bool operator==(const PingRequest&, const PingRequest&) { return true; }
bool operator==(const PingResponse&, const PingResponse&) { return true; }
bool operator==(const Disconnect&, const Disconnect&) { return true; }

bool operator==(const FixedHeader& a, const FixedHeader& b) {
  return a.packet_type == b.packet_type && a.packet_flags == b.packet_flags &&
         a.remaining_length == b.remaining_length;
}

}  // namespace codec
}  // namespace mqtt
