#include "mqtt/logging/log_sink.h"

#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace mqtt {
namespace logging {

void StdioSink::log(const LogMessage& msg) {
  std::string line = formatter_->format(msg);
  std::lock_guard<std::mutex> lock(mutex_);
  std::ostream& out = target_ == Stdout ? std::cout : std::cerr;
  out << line << '\n';
}

void StdioSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  (target_ == Stdout ? std::cout : std::cerr).flush();
}

RotatingFileSink::RotatingFileSink(const Config& config) : config_(config) {
  open();
  if (!file_.is_open()) {
    throw std::runtime_error("Cannot open log file " + config_.path);
  }
}

RotatingFileSink::~RotatingFileSink() {
  if (file_.is_open()) {
    file_.flush();
  }
}

void RotatingFileSink::log(const LogMessage& msg) {
  std::string line = formatter_->format(msg);

  std::lock_guard<std::mutex> lock(mutex_);
  bool too_big = config_.max_file_size > 0 && written_ > 0 &&
                 written_ + line.size() + 1 > config_.max_file_size;
  bool too_old = config_.max_age.count() > 0 &&
                 std::chrono::steady_clock::now() - opened_at_ >
                     config_.max_age;
  if (too_big || too_old) {
    rollOver();
  }
  if (!file_.is_open()) {
    return;
  }

  file_ << line << '\n';
  written_ += line.size() + 1;
  if (config_.flush_each_line) {
    file_.flush();
  }
}

void RotatingFileSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
  }
}

void RotatingFileSink::open() {
  file_.open(config_.path, std::ios::out | std::ios::app);
  written_ = 0;
  if (file_.is_open()) {
    file_.seekp(0, std::ios::end);
    written_ = static_cast<size_t>(file_.tellp());
  }
  opened_at_ = std::chrono::steady_clock::now();
}

void RotatingFileSink::rollOver() {
  namespace fs = std::filesystem;

  file_.close();

  // Rename failures leave the current file in place; logging carries on
  std::error_code ec;
  auto numbered = [this](size_t n) {
    return config_.path + "." + std::to_string(n);
  };
  if (config_.max_files == 0) {
    fs::remove(config_.path, ec);
  } else {
    fs::remove(numbered(config_.max_files), ec);
    for (size_t n = config_.max_files - 1; n > 0; --n) {
      fs::rename(numbered(n), numbered(n + 1), ec);
    }
    fs::rename(config_.path, numbered(1), ec);
  }

  open();
}

std::shared_ptr<LogSink> createSink(const SinkConfig& config) {
  std::shared_ptr<LogSink> sink;
  if (config.file.empty()) {
    sink = std::make_shared<StdioSink>(StdioSink::Stderr);
  } else {
    RotatingFileSink::Config file_config;
    file_config.path = config.file;
    file_config.max_file_size = config.max_file_size;
    file_config.max_files = config.max_files;
    sink = std::make_shared<RotatingFileSink>(file_config);
  }
  if (config.json) {
    sink->setFormatter(std::make_unique<JsonFormatter>());
  }
  return sink;
}

}  // namespace logging
}  // namespace mqtt
