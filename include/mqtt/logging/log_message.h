#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <unistd.h>

#include "mqtt/logging/log_level.h"

namespace mqtt {
namespace logging {

// Which MQTT connection a message is about. Empty for engine-wide messages.
struct LogContext {
  uint64_t connection_id{0};
  std::string client_id;

  bool empty() const { return connection_id == 0 && client_id.empty(); }
};

struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string message;
  std::chrono::system_clock::time_point timestamp{
      std::chrono::system_clock::now()};

  std::string logger_name;
  Component component{Component::Root};

  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  pid_t process_id{getpid()};
  std::thread::id thread_id{std::this_thread::get_id()};

  LogContext context;
};

}  // namespace logging
}  // namespace mqtt
