#include "mqtt/logging/logger_registry.h"

#include <algorithm>

namespace mqtt {
namespace logging {

namespace {

// Only '*' and '?' are special; everything else matches literally
std::regex globToRegex(const std::string& glob) {
  static const std::string kRegexSpecial = "\\^$.|+()[]{}";
  std::string regex;
  for (char c : glob) {
    if (c == '*') {
      regex += ".*";
    } else if (c == '?') {
      regex += '.';
    } else {
      if (kRegexSpecial.find(c) != std::string::npos) {
        regex += '\\';
      }
      regex += c;
    }
  }
  return std::regex(regex);
}

}  // namespace

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry registry;
  return registry;
}

LoggerRegistry::LoggerRegistry()
    : sink_(std::make_shared<StdioSink>(StdioSink::Stderr)) {}

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto& logger = loggers_[name];
  if (!logger) {
    logger = std::make_shared<Logger>(name, componentFromName(name));
    logger->setLevel(levelFor(name));
    logger->setSink(sink_);
  }
  return logger;
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;
  refreshLevels();
}

LogLevel LoggerRegistry::getGlobalLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void LoggerRegistry::setPattern(const std::string& glob, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.push_back(Pattern{globToRegex(glob), level});
  refreshLevels();
}

void LoggerRegistry::clearPatterns() {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.clear();
  refreshLevels();
}

void LoggerRegistry::setDefaultSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
  for (auto& entry : loggers_) {
    entry.second->setSink(sink_);
  }
}

LogLevel LoggerRegistry::getEffectiveLevel(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return levelFor(name);
}

std::vector<std::string> LoggerRegistry::getLoggerNames() const {
  std::vector<std::string> names;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    names.reserve(loggers_.size());
    for (const auto& entry : loggers_) {
      names.push_back(entry.first);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

Component LoggerRegistry::componentFromName(const std::string& name) {
  std::string layer = name.substr(0, name.find('.'));
  for (uint8_t i = 0; i < static_cast<uint8_t>(Component::Count); ++i) {
    auto component = static_cast<Component>(i);
    if (layer == componentToString(component)) {
      return component;
    }
  }
  return Component::Root;
}

LogLevel LoggerRegistry::levelFor(const std::string& name) const {
  for (auto it = patterns_.rbegin(); it != patterns_.rend(); ++it) {
    if (std::regex_match(name, it->regex)) {
      return it->level;
    }
  }
  return global_level_;
}

void LoggerRegistry::refreshLevels() {
  for (auto& entry : loggers_) {
    entry.second->setLevel(levelFor(entry.first));
  }
}

}  // namespace logging
}  // namespace mqtt
