#pragma once

#include "mqtt/logging/logger_registry.h"

// Each source file names its logger before including this header, e.g.
//   #define MQTT_LOG_COMPONENT "server.connection"
#ifndef MQTT_LOG_COMPONENT
#define MQTT_LOG_COMPONENT "root"
#endif

#define MQTT_LOGGER()                                                      \
  ::mqtt::logging::LoggerRegistry::instance().getOrCreateLogger(           \
      MQTT_LOG_COMPONENT)

#ifdef MQTT_LOG_DISABLE
#define MQTT_LOG(level, ...) ((void)0)
#define MQTT_CONN_LOG(level, context, ...) ((void)0)
#else
// MQTT_LOG(Info, "Listening on {}:{}", address, port);
#define MQTT_LOG(level, ...)                                               \
  do {                                                                     \
    auto mqtt_logger_ = MQTT_LOGGER();                                     \
    if (mqtt_logger_->shouldLog(::mqtt::logging::LogLevel::level)) {       \
      mqtt_logger_->log(::mqtt::logging::LogLevel::level, __FILE__,        \
                        __LINE__, __func__, __VA_ARGS__);                  \
    }                                                                      \
  } while (0)

// Same as MQTT_LOG, tagged with a logging::LogContext
#define MQTT_CONN_LOG(level, context, ...)                                 \
  do {                                                                     \
    auto mqtt_logger_ = MQTT_LOGGER();                                     \
    if (mqtt_logger_->shouldLog(::mqtt::logging::LogLevel::level)) {       \
      mqtt_logger_->log((context), ::mqtt::logging::LogLevel::level,       \
                        __FILE__, __LINE__, __func__, __VA_ARGS__);        \
    }                                                                      \
  } while (0)
#endif
