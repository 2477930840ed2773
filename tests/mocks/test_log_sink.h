#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "mqtt/logging/log_sink.h"
#include "mqtt/logging/logger_registry.h"

namespace mqtt {
namespace test {

// Captures log messages so tests can assert on them
class TestLogSink : public logging::LogSink {
 public:
  void log(const logging::LogMessage& msg) override {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(msg);
  }

  void flush() override {}

  bool hasMessage(logging::LogLevel level, const std::string& substr) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& msg : messages_) {
      if (msg.level == level &&
          msg.message.find(substr) != std::string::npos) {
        return true;
      }
    }
    return false;
  }

  size_t count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
  }

  std::vector<logging::LogMessage> messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.clear();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<logging::LogMessage> messages_;
};

// Routes one named logger into a TestLogSink at Debug level
inline std::shared_ptr<TestLogSink> captureLogger(const std::string& name) {
  auto sink = std::make_shared<TestLogSink>();
  auto logger =
      logging::LoggerRegistry::instance().getOrCreateLogger(name);
  logger->setSink(sink);
  logger->setLevel(logging::LogLevel::Debug);
  return sink;
}

}  // namespace test
}  // namespace mqtt
