/**
 * @file server_config.h
 * @brief Typed server configuration loaded from JSON or YAML
 *
 * Example (YAML):
 *
 *   address: 0.0.0.0
 *   port: 1883
 *   max_frame_size: "256KB"
 *   max_inflight: 15
 *   handshake_timeout: "5s"
 *   keep_alive_tick: "1s"
 *   default_idle_timeout: "5m"
 *   log_level: info
 *   log_file: /var/log/mqtt.log
 *   log_format: json
 *   log_max_size: "50MB"
 *
 * Durations accept a unit string or a number of milliseconds, sizes a unit
 * string or a number of bytes. `${VAR}` and `${VAR:-default}` in a file are
 * replaced from the environment before parsing.
 */

#ifndef MQTT_CONFIG_SERVER_CONFIG_H
#define MQTT_CONFIG_SERVER_CONFIG_H

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "mqtt/logging/log_level.h"
#include "mqtt/logging/log_sink.h"

namespace mqtt {
namespace config {

/**
 * Thrown when a configuration field is missing, mistyped or out of range
 */
class ConfigValidationError : public std::runtime_error {
 public:
  ConfigValidationError(const std::string& field, const std::string& reason)
      : std::runtime_error("Configuration validation failed for field '" +
                           field + "': " + reason),
        field_(field),
        reason_(reason) {}

  const std::string& field() const { return field_; }
  const std::string& reason() const { return reason_; }

 private:
  std::string field_;
  std::string reason_;
};

struct ServerConfig {
  std::string address = "127.0.0.1";
  uint16_t port = 1883;

  /// Largest accepted remaining length in bytes, 0 for the protocol limit
  uint32_t max_frame_size = 0;

  /// Concurrent handler invocations per connection, 0 for unlimited
  size_t max_inflight = 15;

  /// Time allowed for CONNECT and the connect handler, 0 disables
  std::chrono::milliseconds handshake_timeout{0};

  /// Keep-alive timer granularity
  std::chrono::milliseconds keep_alive_tick{1000};

  /// Idle timeout replacing the client's keep-alive, 0 keeps the client's
  std::chrono::milliseconds default_idle_timeout{0};

  logging::LogLevel log_level = logging::LogLevel::Info;

  /// Rotating log file, empty for stderr
  std::string log_file;

  /// One JSON object per line instead of text
  bool log_json = false;

  /// Log file size that triggers rollover
  uint64_t log_max_size = 10 * 1024 * 1024;

  logging::SinkConfig logSink() const;

  /**
   * @throws ConfigValidationError if a field is out of range
   */
  void validate() const;

  nlohmann::json toJson() const;

  /**
   * Absent fields keep their defaults.
   * @throws ConfigValidationError on type errors, UnitParseError on bad units
   */
  static ServerConfig fromJson(const nlohmann::json& j);
};

/**
 * Replace `${VAR}` and `${VAR:-default}` from the environment.
 * @throws std::runtime_error for an unset variable without a default
 */
std::string substituteEnvironmentVariables(const std::string& content);

/**
 * Parse configuration text. JSON is tried first, then YAML.
 * @throws std::runtime_error on syntax errors
 */
nlohmann::json parseConfigText(const std::string& content);

/**
 * Read, substitute environment variables, parse and validate a file.
 * @throws std::runtime_error if the file cannot be read or parsed,
 *         ConfigValidationError / UnitParseError on invalid content
 */
ServerConfig loadServerConfigFile(const std::string& path);

}  // namespace config
}  // namespace mqtt

#endif  // MQTT_CONFIG_SERVER_CONFIG_H
