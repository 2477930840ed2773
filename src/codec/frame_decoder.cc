#define MQTT_LOG_COMPONENT "codec.frame"

#include "mqtt/codec/frame_decoder.h"

#include <algorithm>
#include <string>

#include "mqtt/logging/log_macros.h"

namespace mqtt {
namespace codec {

namespace {

// Type byte plus the longest remaining-length encoding
constexpr size_t kMaxFixedHeaderSize = 5;

}  // namespace

const char* frameDecoderStateToString(FrameDecoderState state) {
  switch (state) {
    case FrameDecoderState::AwaitHeader: return "AwaitHeader";
    case FrameDecoderState::AwaitBody: return "AwaitBody";
  }
  return "Unknown";
}

void FrameDecoder::reset() {
  state_ = FrameDecoderState::AwaitHeader;
  header_ = FixedHeader();
}

// Returns true once the header has been consumed and the decoder moved to
// AwaitBody, false when more bytes are needed.
Result<bool> FrameDecoder::decodeHeader(Buffer& buffer) {
  if (buffer.length() < 2) {
    return false;
  }

  uint8_t header[kMaxFixedHeaderSize];
  size_t available = std::min(buffer.length(), kMaxFixedHeaderSize);
  buffer.copyOut(0, available, header);

  auto length = decodeVariableLength(header + 1, available - 1);
  if (isError(length)) {
    return get<Error>(length);
  }
  const auto& decoded = get<optional<VariableLength>>(length);
  if (!decoded) {
    return false;
  }

  if (max_frame_size_ != 0 && decoded->value > max_frame_size_) {
    MQTT_LOG(Warning, "Frame of {} bytes exceeds limit of {}", decoded->value,
             max_frame_size_);
    return Error(errors::MAX_SIZE_EXCEEDED,
                 "Frame size " + std::to_string(decoded->value) +
                     " exceeds maximum " + std::to_string(max_frame_size_));
  }

  header_.packet_type = header[0] >> 4;
  header_.packet_flags = header[0] & 0x0F;
  header_.remaining_length = decoded->value;
  buffer.drain(1 + decoded->consumed);
  state_ = FrameDecoderState::AwaitBody;
  return true;
}

Result<optional<Packet>> FrameDecoder::decode(Buffer& buffer) {
  if (state_ == FrameDecoderState::AwaitHeader) {
    auto advanced = decodeHeader(buffer);
    if (isError(advanced)) {
      reset();
      return get<Error>(advanced);
    }
    if (!get<bool>(advanced)) {
      return optional<Packet>();
    }
  }

  const uint32_t body_length = header_.remaining_length;
  if (buffer.length() < body_length) {
    return optional<Packet>();
  }

  const auto* body = static_cast<const uint8_t*>(buffer.linearize(body_length));
  auto packet = readPacket(body, body_length, header_);
  buffer.drain(body_length);
  FixedHeader header = header_;
  reset();

  if (isError(packet)) {
    const Error& error = get<Error>(packet);
    MQTT_LOG(Debug, "Failed to decode packet type {}: {}",
             static_cast<int>(header.packet_type), error.message);
    return error;
  }
  return make_optional(std::move(get<Packet>(packet)));
}

VoidResult FrameDecoder::encode(const Packet& packet, Buffer& out) const {
  return encodePacket(packet, out);
}

}  // namespace codec
}  // namespace mqtt
