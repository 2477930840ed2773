#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/format.h>

#include "mqtt/logging/log_level.h"
#include "mqtt/logging/log_message.h"
#include "mqtt/logging/log_sink.h"

namespace mqtt {
namespace logging {

/**
 * Named logger writing synchronously to a shared sink.
 *
 * Format strings follow fmt syntax. A format string logged without
 * arguments is written as is, so payload text containing braces is safe.
 */
class Logger {
 public:
  explicit Logger(const std::string& name,
                  Component component = Component::Root)
      : name_(name), component_(component) {}

  template <typename... Args>
  void debug(const char* fmt, Args&&... args) {
    log(LogLevel::Debug, nullptr, 0, nullptr, fmt,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const char* fmt, Args&&... args) {
    log(LogLevel::Info, nullptr, 0, nullptr, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warning(const char* fmt, Args&&... args) {
    log(LogLevel::Warning, nullptr, 0, nullptr, fmt,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const char* fmt, Args&&... args) {
    log(LogLevel::Error, nullptr, 0, nullptr, fmt,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           const char* function,
           const char* fmt,
           Args&&... args) {
    static const LogContext kNoContext;
    log(kNoContext, level, file, line, function, fmt,
        std::forward<Args>(args)...);
  }

  // Tags the message with the connection it concerns
  template <typename... Args>
  void log(const LogContext& context,
           LogLevel level,
           const char* file,
           int line,
           const char* function,
           const char* fmt,
           Args&&... args) {
    if (!shouldLog(level)) {
      return;
    }
    LogMessage msg;
    msg.level = level;
    msg.message = format(fmt, std::forward<Args>(args)...);
    msg.logger_name = name_;
    msg.component = component_;
    msg.file = file;
    msg.line = line;
    msg.function = function;
    msg.context = context;
    write(msg);
  }

  void setLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
  }

  LogLevel getLevel() const { return level_.load(std::memory_order_relaxed); }

  bool shouldLog(LogLevel level) const {
    return level != LogLevel::Off && level >= getLevel();
  }

  void setSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
  }

  std::shared_ptr<LogSink> getSink() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sink_;
  }

  const std::string& getName() const { return name_; }
  Component component() const { return component_; }

  void flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
      sink_->flush();
    }
  }

 private:
  static std::string format(const char* fmt) { return fmt; }

  template <typename First, typename... Rest>
  static std::string format(const char* fmt, First&& first, Rest&&... rest) {
    return fmt::format(fmt::runtime(fmt), std::forward<First>(first),
                       std::forward<Rest>(rest)...);
  }

  void write(const LogMessage& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
      sink_->log(msg);
    }
  }

  const std::string name_;
  const Component component_;
  std::atomic<LogLevel> level_{LogLevel::Info};
  std::shared_ptr<LogSink> sink_;
  mutable std::mutex mutex_;
};

}  // namespace logging
}  // namespace mqtt
