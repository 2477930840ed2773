#include "mqtt/core/result.h"

namespace mqtt {

const char* errorCodeToString(int code) {
  switch (code) {
    case errors::INVALID_PROTOCOL: return "InvalidProtocol";
    case errors::INVALID_LENGTH: return "InvalidLength";
    case errors::MALFORMED_PACKET: return "MalformedPacket";
    case errors::UNSUPPORTED_PROTOCOL_LEVEL: return "UnsupportedProtocolLevel";
    case errors::CONNECT_RESERVED_FLAG_SET: return "ConnectReservedFlagSet";
    case errors::CONNACK_RESERVED_FLAG_SET: return "ConnAckReservedFlagSet";
    case errors::INVALID_CLIENT_ID: return "InvalidClientId";
    case errors::UNSUPPORTED_PACKET_TYPE: return "UnsupportedPacketType";
    case errors::PACKET_ID_REQUIRED: return "PacketIdRequired";
    case errors::MAX_SIZE_EXCEEDED: return "MaxSizeExceeded";
    case errors::UTF8_ERROR: return "Utf8Error";
    case errors::INVALID_QOS: return "InvalidQoS";
    case errors::INVALID_TOPIC: return "InvalidTopic";
    case errors::INVALID_LEVEL: return "InvalidLevel";
    case errors::UNEXPECTED_PACKET: return "UnexpectedPacket";
    case errors::ACK_MISMATCH: return "AckMismatch";
    case errors::CONNECTION_REFUSED: return "ConnectionRefused";
    case errors::HANDSHAKE_TIMEOUT: return "HandshakeTimeout";
    case errors::KEEP_ALIVE_TIMEOUT: return "KeepAliveTimeout";
    case errors::HANDLER_ERROR: return "HandlerError";
    case errors::DISCONNECTED: return "Disconnected";
    case errors::IO_ERROR: return "Io";
    default: return "Unknown";
  }
}

const char* errorCategoryToString(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::Decode: return "decode";
    case ErrorCategory::Protocol: return "protocol";
    case ErrorCategory::Timeout: return "timeout";
    case ErrorCategory::Handler: return "handler";
    case ErrorCategory::Transport: return "transport";
  }
  return "unknown";
}

}  // namespace mqtt
