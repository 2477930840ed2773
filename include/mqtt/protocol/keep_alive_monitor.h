#ifndef MQTT_PROTOCOL_KEEP_ALIVE_MONITOR_H
#define MQTT_PROTOCOL_KEEP_ALIVE_MONITOR_H

#include <chrono>
#include <functional>

#include "mqtt/core/result.h"
#include "mqtt/event/event_loop.h"

namespace mqtt {
namespace protocol {

constexpr std::chrono::milliseconds DEFAULT_KEEP_ALIVE_TICK{1000};

/**
 * Closes idle connections.
 *
 * A periodic timer compares the time of the last inbound frame with the
 * negotiated interval. Any frame counts, PINGREQ included.
 */
class KeepAliveMonitor {
 public:
  using TimeoutCallback = std::function<void(const Error&)>;

  KeepAliveMonitor(event::Dispatcher& dispatcher,
                   TimeoutCallback on_timeout,
                   std::chrono::milliseconds tick = DEFAULT_KEEP_ALIVE_TICK);
  ~KeepAliveMonitor();

  KeepAliveMonitor(const KeepAliveMonitor&) = delete;
  KeepAliveMonitor& operator=(const KeepAliveMonitor&) = delete;

  // Start monitoring; a zero interval leaves the monitor disabled
  void start(std::chrono::milliseconds interval);
  void stop();

  // Record inbound activity
  void onFrameReceived();

  bool enabled() const { return interval_.count() > 0 && running_; }
  std::chrono::milliseconds interval() const { return interval_; }
  std::chrono::milliseconds tick() const { return tick_; }

 private:
  void onTick();

  event::Dispatcher& dispatcher_;
  TimeoutCallback on_timeout_;
  std::chrono::milliseconds tick_;
  std::chrono::milliseconds interval_{0};
  std::chrono::steady_clock::time_point last_activity_;
  event::TimerPtr timer_;
  bool running_{false};
};

}  // namespace protocol
}  // namespace mqtt

#endif  // MQTT_PROTOCOL_KEEP_ALIVE_MONITOR_H
