/**
 * @file frame_decoder.h
 * @brief Incremental MQTT frame decoder
 *
 * Two states:
 * - AwaitHeader: needs the type byte and a complete remaining-length prefix
 * - AwaitBody: header consumed, waiting for remaining_length body bytes
 *
 * Consumed bytes are drained from the input buffer, so decoding resumes
 * across arbitrarily fragmented deliveries without re-parsing.
 */

#ifndef MQTT_CODEC_FRAME_DECODER_H
#define MQTT_CODEC_FRAME_DECODER_H

#include <cstdint>

#include "mqtt/buffer.h"
#include "mqtt/codec/codec.h"
#include "mqtt/codec/packet.h"
#include "mqtt/core/result.h"

namespace mqtt {
namespace codec {

enum class FrameDecoderState { AwaitHeader, AwaitBody };

const char* frameDecoderStateToString(FrameDecoderState state);

class FrameDecoder {
 public:
  // max_frame_size bounds remaining_length; 0 means unlimited
  explicit FrameDecoder(uint32_t max_frame_size = 0)
      : max_frame_size_(max_frame_size) {}

  /**
   * Decode at most one packet from the front of `buffer`.
   *
   * @return the packet, nullopt when more bytes are needed, or an Error.
   * After an error the decoder is back in AwaitHeader and the connection
   * is expected to be torn down.
   */
  Result<optional<Packet>> decode(Buffer& buffer);

  // Append a complete frame for `packet` to `out`
  VoidResult encode(const Packet& packet, Buffer& out) const;

  FrameDecoderState state() const { return state_; }

  // Header of the frame whose body is awaited; valid in AwaitBody only
  const FixedHeader& pendingHeader() const { return header_; }

  uint32_t maxFrameSize() const { return max_frame_size_; }
  void setMaxFrameSize(uint32_t max_frame_size) {
    max_frame_size_ = max_frame_size;
  }

  void reset();

 private:
  Result<bool> decodeHeader(Buffer& buffer);

  FrameDecoderState state_{FrameDecoderState::AwaitHeader};
  FixedHeader header_;
  uint32_t max_frame_size_;
};

}  // namespace codec
}  // namespace mqtt

#endif  // MQTT_CODEC_FRAME_DECODER_H
