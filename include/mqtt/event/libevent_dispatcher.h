#ifndef MQTT_EVENT_LIBEVENT_DISPATCHER_H
#define MQTT_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <deque>
#include <mutex>
#include <thread>

#include "mqtt/event/event_loop.h"

struct event_base;
struct event;

namespace mqtt {
namespace event {

/**
 * Dispatcher on a libevent event_base.
 *
 * Cross-thread post() activates a user event; libevent's pthread locking
 * makes event_active() safe from any thread and wakes a blocked loop.
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  LibeventDispatcher(const LibeventDispatcher&) = delete;
  LibeventDispatcher& operator=(const LibeventDispatcher&) = delete;

  const std::string& name() override { return name_; }

  void post(PostCb callback) override;
  bool isThreadSafe() const override;

  FileEventPtr createFileEvent(int fd,
                               FileReadyCb cb,
                               uint32_t events) override;
  TimerPtr createTimer(TimerCb cb) override;
  SignalEventPtr listenForSignal(int signal_num, SignalCb cb) override;

  void run(RunType type) override;
  void exit() override;
  void shutdown() override;

  event_base* base() { return base_; }

 private:
  class FileEventImpl;
  class TimerImpl;
  class SignalEventImpl;

  static void onPostActivated(int fd, short events, void* arg);
  void runPostCallbacks();

  const std::string name_;
  event_base* base_{nullptr};
  struct event* post_event_{nullptr};
  std::atomic<std::thread::id> thread_id_{};
  std::atomic<bool> exit_requested_{false};

  std::mutex post_mutex_;
  std::deque<PostCb> post_callbacks_;
};

class LibeventDispatcherFactory : public DispatcherFactory {
 public:
  DispatcherPtr createDispatcher(const std::string& name) override;
  const std::string& backendName() const override;
};

}  // namespace event
}  // namespace mqtt

#endif  // MQTT_EVENT_LIBEVENT_DISPATCHER_H
