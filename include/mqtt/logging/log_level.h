#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>

namespace mqtt {
namespace logging {

// Least severe first; Off disables a logger
enum class LogLevel : uint8_t { Debug, Info, Warning, Error, Critical, Off };

// Engine layer owning a logger, taken from the first segment of its name
enum class Component : uint8_t {
  Root,
  Codec,
  Session,
  Protocol,
  Transport,
  Server,
  Client,
  Event,
  Config,
  Count
};

inline const char* logLevelToString(LogLevel level) {
  static const char* const kNames[] = {"DEBUG", "INFO",     "WARNING",
                                       "ERROR", "CRITICAL", "OFF"};
  auto index = static_cast<size_t>(level);
  return index < sizeof(kNames) / sizeof(kNames[0]) ? kNames[index]
                                                    : "UNKNOWN";
}

// Case-insensitive. `level` is left alone when the name is unknown.
inline bool parseLogLevel(const std::string& name, LogLevel& level) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  for (uint8_t i = 0; i <= static_cast<uint8_t>(LogLevel::Off); ++i) {
    auto candidate = static_cast<LogLevel>(i);
    if (upper == logLevelToString(candidate)) {
      level = candidate;
      return true;
    }
  }
  return false;
}

inline const char* componentToString(Component component) {
  static const char* const kNames[] = {
      "root",   "codec",  "session", "protocol", "transport",
      "server", "client", "event",   "config"};
  auto index = static_cast<size_t>(component);
  return index < sizeof(kNames) / sizeof(kNames[0]) ? kNames[index]
                                                    : "unknown";
}

}  // namespace logging
}  // namespace mqtt
