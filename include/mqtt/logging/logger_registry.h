#pragma once

#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "mqtt/logging/logger.h"

namespace mqtt {
namespace logging {

/**
 * Process-wide set of named loggers.
 *
 * Logger names are dotted ("server.connection"). A logger's level comes
 * from the last glob pattern matching its name ("protocol.*", "codec?"),
 * or from the global level when none does. Every logger writes to the
 * registry's sink.
 */
class LoggerRegistry {
 public:
  static LoggerRegistry& instance();

  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);

  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  void setPattern(const std::string& glob, LogLevel level);
  void clearPatterns();

  // Replaces the sink of every logger, present and future
  void setDefaultSink(std::shared_ptr<LogSink> sink);

  LogLevel getEffectiveLevel(const std::string& name) const;

  std::vector<std::string> getLoggerNames() const;

  static Component componentFromName(const std::string& name);

 private:
  struct Pattern {
    std::regex regex;
    LogLevel level;
  };

  LoggerRegistry();

  LogLevel levelFor(const std::string& name) const;
  void refreshLevels();

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::vector<Pattern> patterns_;
  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<LogSink> sink_;
};

}  // namespace logging
}  // namespace mqtt
