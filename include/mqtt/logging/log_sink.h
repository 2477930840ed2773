#pragma once

#include <chrono>
#include <cstddef>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "mqtt/logging/log_formatter.h"
#include "mqtt/logging/log_message.h"

namespace mqtt {
namespace logging {

class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void log(const LogMessage& msg) = 0;
  virtual void flush() = 0;

  void setFormatter(std::unique_ptr<Formatter> formatter) {
    formatter_ = std::move(formatter);
  }

 protected:
  std::unique_ptr<Formatter> formatter_{std::make_unique<DefaultFormatter>()};
};

class StdioSink : public LogSink {
 public:
  enum Target { Stdout, Stderr };

  explicit StdioSink(Target target = Stderr) : target_(target) {}

  void log(const LogMessage& msg) override;
  void flush() override;

 private:
  Target target_;
  std::mutex mutex_;
};

/**
 * Appends to `path`, rolling it over to path.1 ... path.N by size and,
 * optionally, by age. The oldest file beyond N is removed.
 */
class RotatingFileSink : public LogSink {
 public:
  struct Config {
    std::string path;
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 5;
    std::chrono::seconds max_age{0};  // 0: size only
    bool flush_each_line = false;
  };

  // Throws std::runtime_error if the file cannot be opened
  explicit RotatingFileSink(const Config& config);
  ~RotatingFileSink() override;

  void log(const LogMessage& msg) override;
  void flush() override;

 private:
  void open();
  void rollOver();

  const Config config_;
  std::ofstream file_;
  size_t written_{0};
  std::chrono::steady_clock::time_point opened_at_;
  std::mutex mutex_;
};

// Hands every formatted line to an embedding application
class ExternalSink : public LogSink {
 public:
  using LineCallback = std::function<void(
      LogLevel level, const std::string& logger, const std::string& line)>;

  explicit ExternalSink(LineCallback callback)
      : callback_(std::move(callback)) {}

  void log(const LogMessage& msg) override {
    callback_(msg.level, msg.logger_name, formatter_->format(msg));
  }

  void flush() override {}

 private:
  LineCallback callback_;
};

// Log destination chosen by configuration
struct SinkConfig {
  std::string file;  // Empty writes to stderr
  bool json = false;
  size_t max_file_size = 10 * 1024 * 1024;
  size_t max_files = 5;
};

std::shared_ptr<LogSink> createSink(const SinkConfig& config);

}  // namespace logging
}  // namespace mqtt
