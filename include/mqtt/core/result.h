#ifndef MQTT_CORE_RESULT_H
#define MQTT_CORE_RESULT_H

#include <string>
#include <utility>

#include "mqtt/core/compat.h"

namespace mqtt {

// Error value carried by every fallible operation in the library.
// `code` is one of the constants in mqtt::errors.
struct Error {
  int code{0};
  std::string message;

  Error() = default;
  Error(int c, const std::string& m) : code(c), message(m) {}
};

inline bool operator==(const Error& a, const Error& b) {
  return a.code == b.code && a.message == b.message;
}

template <typename T>
using Result = variant<T, Error>;

using VoidResult = Result<std::nullptr_t>;

inline VoidResult makeVoidSuccess() { return VoidResult(nullptr); }

inline VoidResult makeVoidError(const Error& error) {
  return VoidResult(error);
}

template <typename T>
Result<T> makeSuccess(T&& value) {
  return Result<T>(std::forward<T>(value));
}

template <typename T>
Result<T> makeError(const Error& error) {
  return Result<T>(error);
}

template <typename T>
Result<T> makeError(int code, const std::string& message) {
  return Result<T>(Error(code, message));
}

template <typename T>
bool isError(const Result<T>& result) {
  return holds_alternative<Error>(result);
}

// MQTT error codes, grouped by category in blocks of 100
namespace errors {

// Decode errors: malformed bytes on the wire
constexpr int INVALID_PROTOCOL = 1;
constexpr int INVALID_LENGTH = 2;
constexpr int MALFORMED_PACKET = 3;
constexpr int UNSUPPORTED_PROTOCOL_LEVEL = 4;
constexpr int CONNECT_RESERVED_FLAG_SET = 5;
constexpr int CONNACK_RESERVED_FLAG_SET = 6;
constexpr int INVALID_CLIENT_ID = 7;
constexpr int UNSUPPORTED_PACKET_TYPE = 8;
constexpr int PACKET_ID_REQUIRED = 9;
constexpr int MAX_SIZE_EXCEEDED = 10;
constexpr int UTF8_ERROR = 11;
constexpr int INVALID_QOS = 12;
constexpr int INVALID_TOPIC = 13;
constexpr int INVALID_LEVEL = 14;

// Protocol ordering violations
constexpr int UNEXPECTED_PACKET = 100;
constexpr int ACK_MISMATCH = 101;
// CONNACK carried a refusal code
constexpr int CONNECTION_REFUSED = 102;

// Liveness
constexpr int HANDSHAKE_TIMEOUT = 200;
constexpr int KEEP_ALIVE_TIMEOUT = 201;

// Errors raised by application handlers
constexpr int HANDLER_ERROR = 300;

// Transport and lifecycle
constexpr int DISCONNECTED = 400;
constexpr int IO_ERROR = 401;

}  // namespace errors

enum class ErrorCategory { Decode, Protocol, Timeout, Handler, Transport };

inline ErrorCategory errorCategory(int code) {
  if (code < 100) return ErrorCategory::Decode;
  if (code < 200) return ErrorCategory::Protocol;
  if (code < 300) return ErrorCategory::Timeout;
  if (code < 400) return ErrorCategory::Handler;
  return ErrorCategory::Transport;
}

const char* errorCodeToString(int code);
const char* errorCategoryToString(ErrorCategory category);

}  // namespace mqtt

#endif  // MQTT_CORE_RESULT_H
