#pragma once

#include <string>

#include "mqtt/logging/log_message.h"

namespace mqtt {
namespace logging {

class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// [time] [LEVEL] [T:thread] [logger] [file:line] [conn:N] [client:id] text
class DefaultFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// One JSON object per line
class JsonFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

}  // namespace logging
}  // namespace mqtt
