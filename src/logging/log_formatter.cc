#include "mqtt/logging/log_formatter.h"

#include <cstring>
#include <ctime>
#include <iterator>
#include <sstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace mqtt {
namespace logging {

namespace {

std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;

  std::tm tm_buf;
  localtime_r(&time_t, &tm_buf);

  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return fmt::format("{}.{:03d}", date, static_cast<int>(ms.count()));
}

std::string threadIdToString(std::thread::id id) {
  std::ostringstream oss;
  oss << id;
  return oss.str();
}

}  // namespace

std::string DefaultFormatter::format(const LogMessage& msg) const {
  fmt::memory_buffer out;
  auto it = std::back_inserter(out);

  fmt::format_to(it, "[{}] [{}] [T:{}] [{}] ", formatTimestamp(msg.timestamp),
                 logLevelToString(msg.level), threadIdToString(msg.thread_id),
                 msg.logger_name);

  if (msg.file != nullptr && msg.line > 0) {
    const char* slash = std::strrchr(msg.file, '/');
    fmt::format_to(it, "[{}:{}] ", slash ? slash + 1 : msg.file, msg.line);
  }

  if (msg.context.connection_id != 0) {
    fmt::format_to(it, "[conn:{}] ", msg.context.connection_id);
  }
  if (!msg.context.client_id.empty()) {
    fmt::format_to(it, "[client:{}] ", msg.context.client_id);
  }

  fmt::format_to(it, "{}", msg.message);
  return fmt::to_string(out);
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  nlohmann::json j;
  j["timestamp"] = formatTimestamp(msg.timestamp);
  j["level"] = logLevelToString(msg.level);
  j["logger"] = msg.logger_name;
  j["component"] = componentToString(msg.component);
  j["pid"] = msg.process_id;
  j["thread"] = threadIdToString(msg.thread_id);
  if (msg.file != nullptr) {
    j["file"] = msg.file;
    j["line"] = msg.line;
  }
  if (msg.function != nullptr) {
    j["function"] = msg.function;
  }
  if (msg.context.connection_id != 0) {
    j["connection_id"] = msg.context.connection_id;
  }
  if (!msg.context.client_id.empty()) {
    j["client_id"] = msg.context.client_id;
  }
  j["message"] = msg.message;

  // Client ids and topics are peer-supplied; never throw on bad UTF-8
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace logging
}  // namespace mqtt
