#define MQTT_LOG_COMPONENT "codec"

#include "mqtt/codec/codec.h"

#include <limits>
#include <string>
#include <utility>

#include "mqtt/codec/topic.h"
#include "mqtt/logging/log_macros.h"

namespace mqtt {
namespace codec {

namespace {

// Accepts well-formed UTF-8 only: no overlong forms, no surrogates, nothing
// above U+10FFFF.
bool isValidUtf8(const uint8_t* data, size_t len) {
  size_t i = 0;
  while (i < len) {
    uint8_t c = data[i];
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t extra;
    uint32_t cp;
    if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
    } else {
      return false;
    }

    if (i + extra >= len) {
      return false;
    }
    for (size_t k = 1; k <= extra; ++k) {
      uint8_t cc = data[i + k];
      if ((cc & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }

    if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
        (extra == 3 && cp < 0x10000)) {
      return false;  // overlong
    }
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

Result<QoS> qosFromBits(uint8_t bits) {
  if (bits > 2) {
    return Error(errors::INVALID_QOS,
                 "Invalid QoS value " + std::to_string(bits));
  }
  return static_cast<QoS>(bits);
}

// Bounds-checked cursor over a single frame body
class Reader {
 public:
  Reader(const uint8_t* data, size_t len) : data_(data), len_(len) {}

  size_t remaining() const { return len_ - pos_; }

  Result<uint8_t> readU8() {
    if (remaining() < 1) {
      return truncated("byte");
    }
    return data_[pos_++];
  }

  Result<uint16_t> readU16() {
    if (remaining() < 2) {
      return truncated("u16");
    }
    uint16_t value =
        static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
    pos_ += 2;
    return value;
  }

  // Packet identifiers are never zero on the wire
  Result<uint16_t> readPacketId() {
    auto id = readU16();
    if (isError(id)) {
      return id;
    }
    if (get<uint16_t>(id) == 0) {
      return Error(errors::MALFORMED_PACKET,
                   "Packet identifier must be non-zero");
    }
    return id;
  }

  Result<Bytes> readBytes() {
    auto len = readU16();
    if (isError(len)) {
      return get<Error>(len);
    }
    size_t n = get<uint16_t>(len);
    if (remaining() < n) {
      return Error(errors::INVALID_LENGTH,
                   "Field length " + std::to_string(n) + " exceeds frame");
    }
    Bytes value(reinterpret_cast<const char*>(data_ + pos_), n);
    pos_ += n;
    return value;
  }

  Result<std::string> readString() {
    auto len = readU16();
    if (isError(len)) {
      return get<Error>(len);
    }
    size_t n = get<uint16_t>(len);
    if (remaining() < n) {
      return Error(errors::INVALID_LENGTH,
                   "String length " + std::to_string(n) + " exceeds frame");
    }
    if (!isValidUtf8(data_ + pos_, n)) {
      return Error(errors::UTF8_ERROR, "String is not valid UTF-8");
    }
    std::string value(reinterpret_cast<const char*>(data_ + pos_), n);
    pos_ += n;
    return value;
  }

  Bytes readRest() {
    Bytes value(reinterpret_cast<const char*>(data_ + pos_), remaining());
    pos_ = len_;
    return value;
  }

 private:
  static Error truncated(const char* what) {
    return Error(errors::INVALID_LENGTH,
                 std::string("Frame too short to read ") + what);
  }

  const uint8_t* data_;
  size_t len_;
  size_t pos_{0};
};

Result<Packet> decodeConnect(Reader& reader) {
  if (reader.remaining() < 10) {
    return Error(errors::INVALID_LENGTH, "CONNECT variable header too short");
  }

  auto name = reader.readBytes();
  if (isError(name) || get<Bytes>(name) != "MQTT") {
    return Error(errors::INVALID_PROTOCOL, "Protocol name must be MQTT");
  }

  auto level = get<uint8_t>(reader.readU8());
  if (level != MQTT_LEVEL_3_1_1) {
    return Error(errors::UNSUPPORTED_PROTOCOL_LEVEL,
                 "Unsupported protocol level " + std::to_string(level));
  }

  auto flags = get<uint8_t>(reader.readU8());
  if (flags & connect_flags::RESERVED) {
    return Error(errors::CONNECT_RESERVED_FLAG_SET,
                 "CONNECT reserved flag must be zero");
  }

  Connect connect;
  connect.protocol_level = level;
  connect.clean_session = (flags & connect_flags::CLEAN_SESSION) != 0;

  auto keep_alive = reader.readU16();
  if (isError(keep_alive)) {
    return get<Error>(keep_alive);
  }
  connect.keep_alive = get<uint16_t>(keep_alive);

  auto client_id = reader.readString();
  if (isError(client_id)) {
    return get<Error>(client_id);
  }
  connect.client_id = std::move(get<std::string>(client_id));
  if (connect.client_id.empty() && !connect.clean_session) {
    return Error(errors::INVALID_CLIENT_ID,
                 "Empty client id requires clean session");
  }

  if (flags & connect_flags::WILL) {
    auto qos = qosFromBits((flags & connect_flags::WILL_QOS) >> 3);
    if (isError(qos)) {
      return get<Error>(qos);
    }
    auto topic = reader.readString();
    if (isError(topic)) {
      return get<Error>(topic);
    }
    auto message = reader.readBytes();
    if (isError(message)) {
      return get<Error>(message);
    }
    LastWill will;
    will.qos = get<QoS>(qos);
    will.retain = (flags & connect_flags::WILL_RETAIN) != 0;
    will.topic = std::move(get<std::string>(topic));
    will.message = std::move(get<Bytes>(message));
    connect.last_will = std::move(will);
  }

  if (flags & connect_flags::USERNAME) {
    auto username = reader.readString();
    if (isError(username)) {
      return get<Error>(username);
    }
    connect.username = std::move(get<std::string>(username));
  }

  if (flags & connect_flags::PASSWORD) {
    auto password = reader.readBytes();
    if (isError(password)) {
      return get<Error>(password);
    }
    connect.password = std::move(get<Bytes>(password));
  }

  return Packet(std::move(connect));
}

Result<Packet> decodeConnectAck(Reader& reader) {
  if (reader.remaining() < 2) {
    return Error(errors::INVALID_LENGTH, "CONNACK too short");
  }
  auto flags = get<uint8_t>(reader.readU8());
  if (flags & 0xFE) {
    return Error(errors::CONNACK_RESERVED_FLAG_SET,
                 "CONNACK reserved flags must be zero");
  }
  ConnectAck ack;
  ack.session_present = (flags & 0x01) != 0;
  ack.return_code = connectCodeFromByte(get<uint8_t>(reader.readU8()));
  return Packet(ack);
}

Result<Packet> decodePublish(Reader& reader, uint8_t flags) {
  auto qos = qosFromBits((flags & 0x06) >> 1);
  if (isError(qos)) {
    return get<Error>(qos);
  }

  auto topic = reader.readString();
  if (isError(topic)) {
    return get<Error>(topic);
  }

  VoidResult name = validateTopicName(get<std::string>(topic));
  if (isError(name)) {
    return get<Error>(name);
  }

  Publish publish;
  publish.dup = (flags & 0x08) != 0;
  publish.retain = (flags & 0x01) != 0;
  publish.qos = get<QoS>(qos);
  publish.topic = std::move(get<std::string>(topic));

  if (publish.qos != QoS::AtMostOnce) {
    auto id = reader.readPacketId();
    if (isError(id)) {
      return get<Error>(id);
    }
    publish.packet_id = get<uint16_t>(id);
  }

  publish.payload = reader.readRest();
  return Packet(std::move(publish));
}

Result<Packet> decodeSubscribe(Reader& reader) {
  auto id = reader.readPacketId();
  if (isError(id)) {
    return get<Error>(id);
  }

  Subscribe subscribe;
  subscribe.packet_id = get<uint16_t>(id);
  while (reader.remaining() > 0) {
    auto filter = reader.readString();
    if (isError(filter)) {
      return get<Error>(filter);
    }
    auto requested = reader.readU8();
    if (isError(requested)) {
      return get<Error>(requested);
    }
    auto qos = qosFromBits(get<uint8_t>(requested) & 0x03);
    if (isError(qos)) {
      return get<Error>(qos);
    }
    subscribe.topic_filters.push_back(
        SubscribeTopic{std::move(get<std::string>(filter)), get<QoS>(qos)});
  }
  return Packet(std::move(subscribe));
}

Result<Packet> decodeSubscribeAck(Reader& reader) {
  auto id = reader.readPacketId();
  if (isError(id)) {
    return get<Error>(id);
  }

  SubscribeAck ack;
  ack.packet_id = get<uint16_t>(id);
  while (reader.remaining() > 0) {
    auto code = get<uint8_t>(reader.readU8());
    if (code == 0x80) {
      ack.status.push_back(SubscribeReturnCode::Failure());
      continue;
    }
    auto qos = qosFromBits(code & 0x03);
    if (isError(qos)) {
      return get<Error>(qos);
    }
    ack.status.push_back(SubscribeReturnCode::Success(get<QoS>(qos)));
  }
  return Packet(std::move(ack));
}

Result<Packet> decodeUnsubscribe(Reader& reader) {
  auto id = reader.readPacketId();
  if (isError(id)) {
    return get<Error>(id);
  }

  Unsubscribe unsubscribe;
  unsubscribe.packet_id = get<uint16_t>(id);
  while (reader.remaining() > 0) {
    auto filter = reader.readString();
    if (isError(filter)) {
      return get<Error>(filter);
    }
    unsubscribe.topic_filters.push_back(std::move(get<std::string>(filter)));
  }
  return Packet(std::move(unsubscribe));
}

// PUBACK, PUBREC, PUBREL, PUBCOMP and UNSUBACK carry only an identifier
template <typename T>
Result<Packet> decodeIdOnly(Reader& reader) {
  auto id = reader.readPacketId();
  if (isError(id)) {
    return get<Error>(id);
  }
  T packet;
  packet.packet_id = get<uint16_t>(id);
  return Packet(packet);
}

// ===== Encoding =====

constexpr size_t kMaxStringLength = std::numeric_limits<uint16_t>::max();

VoidResult checkString(size_t len, const char* field) {
  if (len > kMaxStringLength) {
    return makeVoidError(Error(
        errors::MALFORMED_PACKET,
        std::string(field) + " exceeds 65535 bytes"));
  }
  return makeVoidSuccess();
}

void writeString(const std::string& value, Buffer& out) {
  out.writeBEInt<uint16_t>(static_cast<uint16_t>(value.size()));
  out.add(value);
}

// Reject packets that cannot be represented on the wire before any byte is
// written.
VoidResult validateForEncode(const Packet& packet) {
  if (auto* connect = get_if<Connect>(&packet)) {
    VoidResult r = checkString(connect->client_id.size(), "client id");
    if (isError(r)) return r;
    if (connect->last_will) {
      r = checkString(connect->last_will->topic.size(), "will topic");
      if (isError(r)) return r;
      r = checkString(connect->last_will->message.size(), "will message");
      if (isError(r)) return r;
    }
    if (connect->username) {
      r = checkString(connect->username->size(), "username");
      if (isError(r)) return r;
    }
    if (connect->password) {
      r = checkString(connect->password->size(), "password");
      if (isError(r)) return r;
    }
  } else if (auto* publish = get_if<Publish>(&packet)) {
    VoidResult r = checkString(publish->topic.size(), "topic");
    if (isError(r)) return r;
    r = validateTopicName(publish->topic);
    if (isError(r)) return r;
    if (publish->qos != QoS::AtMostOnce &&
        (!publish->packet_id || *publish->packet_id == 0)) {
      return makeVoidError(Error(errors::PACKET_ID_REQUIRED,
                                 "QoS > 0 publish requires a packet id"));
    }
  } else if (auto* subscribe = get_if<Subscribe>(&packet)) {
    for (const auto& entry : subscribe->topic_filters) {
      VoidResult r = checkString(entry.filter.size(), "topic filter");
      if (isError(r)) return r;
    }
  } else if (auto* unsubscribe = get_if<Unsubscribe>(&packet)) {
    for (const auto& filter : unsubscribe->topic_filters) {
      VoidResult r = checkString(filter.size(), "topic filter");
      if (isError(r)) return r;
    }
  }
  return makeVoidSuccess();
}

struct BodyWriter {
  Buffer& out;

  void operator()(const Connect& connect) const {
    writeString("MQTT", out);

    uint8_t flags = 0;
    if (connect.username) flags |= connect_flags::USERNAME;
    if (connect.password) flags |= connect_flags::PASSWORD;
    if (connect.last_will) {
      flags |= connect_flags::WILL;
      if (connect.last_will->retain) flags |= connect_flags::WILL_RETAIN;
      flags |= static_cast<uint8_t>(
          static_cast<uint8_t>(connect.last_will->qos) << 3);
    }
    if (connect.clean_session) flags |= connect_flags::CLEAN_SESSION;

    uint8_t header[2] = {connect.protocol_level, flags};
    out.add(header, sizeof(header));
    out.writeBEInt<uint16_t>(connect.keep_alive);
    writeString(connect.client_id, out);
    if (connect.last_will) {
      writeString(connect.last_will->topic, out);
      writeString(connect.last_will->message, out);
    }
    if (connect.username) writeString(*connect.username, out);
    if (connect.password) writeString(*connect.password, out);
  }

  void operator()(const ConnectAck& ack) const {
    uint8_t body[2] = {static_cast<uint8_t>(ack.session_present ? 1 : 0),
                       static_cast<uint8_t>(ack.return_code)};
    out.add(body, sizeof(body));
  }

  void operator()(const Publish& publish) const {
    writeString(publish.topic, out);
    if (publish.qos != QoS::AtMostOnce) {
      out.writeBEInt<uint16_t>(*publish.packet_id);
    }
    out.add(publish.payload);
  }

  void operator()(const PublishAck& p) const {
    out.writeBEInt<uint16_t>(p.packet_id);
  }
  void operator()(const PublishReceived& p) const {
    out.writeBEInt<uint16_t>(p.packet_id);
  }
  void operator()(const PublishRelease& p) const {
    out.writeBEInt<uint16_t>(p.packet_id);
  }
  void operator()(const PublishComplete& p) const {
    out.writeBEInt<uint16_t>(p.packet_id);
  }

  void operator()(const Subscribe& subscribe) const {
    out.writeBEInt<uint16_t>(subscribe.packet_id);
    for (const auto& entry : subscribe.topic_filters) {
      writeString(entry.filter, out);
      out.writeBEInt<uint8_t>(static_cast<uint8_t>(entry.qos));
    }
  }

  void operator()(const SubscribeAck& ack) const {
    out.writeBEInt<uint16_t>(ack.packet_id);
    for (const auto& code : ack.status) {
      out.writeBEInt<uint8_t>(code.toByte());
    }
  }

  void operator()(const Unsubscribe& unsubscribe) const {
    out.writeBEInt<uint16_t>(unsubscribe.packet_id);
    for (const auto& filter : unsubscribe.topic_filters) {
      writeString(filter, out);
    }
  }

  void operator()(const UnsubscribeAck& ack) const {
    out.writeBEInt<uint16_t>(ack.packet_id);
  }

  void operator()(const PingRequest&) const {}
  void operator()(const PingResponse&) const {}
  void operator()(const Disconnect&) const {}
};

struct SizeVisitor {
  size_t operator()(const Connect& connect) const {
    // protocol name (6) + level (1) + flags (1) + keep alive (2)
    size_t size = 10 + 2 + connect.client_id.size();
    if (connect.last_will) {
      size += 2 + connect.last_will->topic.size();
      size += 2 + connect.last_will->message.size();
    }
    if (connect.username) size += 2 + connect.username->size();
    if (connect.password) size += 2 + connect.password->size();
    return size;
  }

  size_t operator()(const Publish& publish) const {
    size_t size = 2 + publish.topic.size() + publish.payload.size();
    if (publish.qos != QoS::AtMostOnce) size += 2;
    return size;
  }

  size_t operator()(const Subscribe& subscribe) const {
    size_t size = 2;
    for (const auto& entry : subscribe.topic_filters) {
      size += 2 + entry.filter.size() + 1;
    }
    return size;
  }

  size_t operator()(const SubscribeAck& ack) const {
    return 2 + ack.status.size();
  }

  size_t operator()(const Unsubscribe& unsubscribe) const {
    size_t size = 2;
    for (const auto& filter : unsubscribe.topic_filters) {
      size += 2 + filter.size();
    }
    return size;
  }

  size_t operator()(const ConnectAck&) const { return 2; }
  size_t operator()(const PublishAck&) const { return 2; }
  size_t operator()(const PublishReceived&) const { return 2; }
  size_t operator()(const PublishRelease&) const { return 2; }
  size_t operator()(const PublishComplete&) const { return 2; }
  size_t operator()(const UnsubscribeAck&) const { return 2; }
  size_t operator()(const PingRequest&) const { return 0; }
  size_t operator()(const PingResponse&) const { return 0; }
  size_t operator()(const Disconnect&) const { return 0; }
};

}  // namespace

Result<optional<VariableLength>> decodeVariableLength(const uint8_t* data,
                                                      size_t len) {
  uint32_t value = 0;
  for (size_t i = 0; i < 4; ++i) {
    if (i >= len) {
      return optional<VariableLength>();
    }
    uint8_t byte = data[i];
    value |= static_cast<uint32_t>(byte & 0x7F) << (7 * i);
    if ((byte & 0x80) == 0) {
      return make_optional(VariableLength{value, i + 1});
    }
  }
  return Error(errors::INVALID_LENGTH,
               "Remaining length continuation bit set on fourth byte");
}

Result<Packet> readPacket(const uint8_t* data,
                          size_t len,
                          const FixedHeader& header) {
  if (len < header.remaining_length) {
    return Error(errors::INVALID_LENGTH,
                 "Frame body shorter than remaining length");
  }
  Reader reader(data, header.remaining_length);

  switch (header.packet_type) {
    case packet_type::CONNECT:
      return decodeConnect(reader);
    case packet_type::CONNACK:
      return decodeConnectAck(reader);
    case packet_type::PUBLISH:
      return decodePublish(reader, header.packet_flags);
    case packet_type::PUBACK:
      return decodeIdOnly<PublishAck>(reader);
    case packet_type::PUBREC:
      return decodeIdOnly<PublishReceived>(reader);
    case packet_type::PUBREL:
      return decodeIdOnly<PublishRelease>(reader);
    case packet_type::PUBCOMP:
      return decodeIdOnly<PublishComplete>(reader);
    case packet_type::SUBSCRIBE:
      return decodeSubscribe(reader);
    case packet_type::SUBACK:
      return decodeSubscribeAck(reader);
    case packet_type::UNSUBSCRIBE:
      return decodeUnsubscribe(reader);
    case packet_type::UNSUBACK:
      return decodeIdOnly<UnsubscribeAck>(reader);
    case packet_type::PINGREQ:
      return Packet(PingRequest{});
    case packet_type::PINGRESP:
      return Packet(PingResponse{});
    case packet_type::DISCONNECT:
      return Packet(Disconnect{});
    default:
      MQTT_LOG(Debug, "Unsupported packet type {}",
               static_cast<int>(header.packet_type));
      return Error(errors::UNSUPPORTED_PACKET_TYPE,
                   "Unsupported packet type " +
                       std::to_string(header.packet_type));
  }
}

size_t variableLengthSize(uint32_t value) {
  if (value < 128) return 1;
  if (value < 16384) return 2;
  if (value < 2097152) return 3;
  return 4;
}

VoidResult writeVariableLength(uint32_t value, Buffer& out) {
  if (value > MAX_REMAINING_LENGTH) {
    return makeVoidError(Error(errors::INVALID_LENGTH,
                               "Remaining length " + std::to_string(value) +
                                   " exceeds maximum"));
  }
  uint8_t bytes[4];
  size_t n = 0;
  do {
    uint8_t byte = value & 0x7F;
    value >>= 7;
    if (value > 0) {
      byte |= 0x80;
    }
    bytes[n++] = byte;
  } while (value > 0);
  out.add(bytes, n);
  return makeVoidSuccess();
}

size_t getEncodedSize(const Packet& packet) {
  return visit(SizeVisitor{}, packet);
}

VoidResult writePacket(const Packet& packet,
                       uint32_t remaining_length,
                       Buffer& out) {
  VoidResult valid = validateForEncode(packet);
  if (isError(valid)) {
    return valid;
  }
  if (remaining_length != getEncodedSize(packet)) {
    return makeVoidError(Error(errors::MALFORMED_PACKET,
                               "Remaining length does not match packet size"));
  }

  // Assemble the whole frame first so a failure never leaves a partial frame
  OwnedBuffer frame;
  uint8_t first = static_cast<uint8_t>((packetType(packet) << 4) |
                                       packetFlags(packet));
  frame.add(&first, 1);
  VoidResult length = writeVariableLength(remaining_length, frame);
  if (isError(length)) {
    return length;
  }
  visit(BodyWriter{frame}, packet);
  frame.move(out);
  return makeVoidSuccess();
}

VoidResult encodePacket(const Packet& packet, Buffer& out) {
  size_t size = getEncodedSize(packet);
  if (size > MAX_REMAINING_LENGTH) {
    return makeVoidError(Error(errors::INVALID_LENGTH,
                               "Packet size " + std::to_string(size) +
                                   " exceeds maximum remaining length"));
  }
  return writePacket(packet, static_cast<uint32_t>(size), out);
}

}  // namespace codec
}  // namespace mqtt
