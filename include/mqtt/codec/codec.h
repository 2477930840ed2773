/**
 * @file codec.h
 * @brief Stateless MQTT 3.1.1 wire codec
 *
 * Decoding works on raw byte ranges so the frame decoder can hand over
 * exactly one frame body. Encoding appends complete frames to a Buffer.
 */

#ifndef MQTT_CODEC_CODEC_H
#define MQTT_CODEC_CODEC_H

#include <cstddef>
#include <cstdint>

#include "mqtt/buffer.h"
#include "mqtt/codec/packet.h"
#include "mqtt/core/result.h"

namespace mqtt {
namespace codec {

// Largest value representable by the 4 byte remaining-length encoding
constexpr uint32_t MAX_REMAINING_LENGTH = 268435455;

struct VariableLength {
  uint32_t value{0};
  // Number of bytes the encoding occupied
  size_t consumed{0};
};

/**
 * Decode a remaining-length field.
 *
 * @return nullopt when more bytes are needed, an Error when a fourth byte
 * still carries the continuation bit.
 */
Result<optional<VariableLength>> decodeVariableLength(const uint8_t* data,
                                                      size_t len);

/**
 * Decode one packet body. `len` is the number of body bytes available and
 * must be at least header.remaining_length. Bytes past the fields a packet
 * declares are ignored.
 */
Result<Packet> readPacket(const uint8_t* data,
                          size_t len,
                          const FixedHeader& header);

// Number of bytes needed to encode `value` as a remaining length
size_t variableLengthSize(uint32_t value);

VoidResult writeVariableLength(uint32_t value, Buffer& out);

// Body size of the packet, excluding the fixed header
size_t getEncodedSize(const Packet& packet);

/**
 * Append a complete frame to `out`. Nothing is appended on failure.
 */
VoidResult writePacket(const Packet& packet,
                       uint32_t remaining_length,
                       Buffer& out);

// getEncodedSize() followed by writePacket()
VoidResult encodePacket(const Packet& packet, Buffer& out);

}  // namespace codec
}  // namespace mqtt

#endif  // MQTT_CODEC_CODEC_H
