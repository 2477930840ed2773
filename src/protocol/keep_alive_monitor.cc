#define MQTT_LOG_COMPONENT "protocol.keepalive"

#include "mqtt/protocol/keep_alive_monitor.h"

#include <algorithm>
#include <string>
#include <utility>

#include "mqtt/logging/log_macros.h"

namespace mqtt {
namespace protocol {

KeepAliveMonitor::KeepAliveMonitor(event::Dispatcher& dispatcher,
                                   TimeoutCallback on_timeout,
                                   std::chrono::milliseconds tick)
    : dispatcher_(dispatcher),
      on_timeout_(std::move(on_timeout)),
      tick_(tick.count() > 0 ? tick : DEFAULT_KEEP_ALIVE_TICK),
      last_activity_(std::chrono::steady_clock::now()) {}

KeepAliveMonitor::~KeepAliveMonitor() { stop(); }

void KeepAliveMonitor::start(std::chrono::milliseconds interval) {
  stop();
  interval_ = interval;
  last_activity_ = std::chrono::steady_clock::now();
  if (interval_.count() <= 0) {
    MQTT_LOG(Debug, "Keep-alive disabled");
    return;
  }

  if (!timer_) {
    timer_ = dispatcher_.createTimer([this]() { onTick(); });
  }
  running_ = true;
  // Never tick slower than the interval itself
  timer_->enableTimer(std::min(tick_, interval_));
  MQTT_LOG(Debug, "Keep-alive interval {} ms, tick {} ms", interval_.count(),
           tick_.count());
}

void KeepAliveMonitor::stop() {
  running_ = false;
  if (timer_) {
    timer_->disableTimer();
  }
}

void KeepAliveMonitor::onFrameReceived() {
  last_activity_ = std::chrono::steady_clock::now();
}

void KeepAliveMonitor::onTick() {
  if (!running_) {
    return;
  }

  auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - last_activity_);
  if (idle >= interval_) {
    running_ = false;
    MQTT_LOG(Info, "Keep-alive timeout: idle for {} ms (limit {} ms)",
             idle.count(), interval_.count());
    if (on_timeout_) {
      on_timeout_(Error(errors::KEEP_ALIVE_TIMEOUT,
                        "No frame received for " +
                            std::to_string(idle.count()) + " ms"));
    }
    return;
  }

  timer_->enableTimer(std::min(tick_, interval_));
}

}  // namespace protocol
}  // namespace mqtt
