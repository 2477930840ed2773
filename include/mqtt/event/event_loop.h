#ifndef MQTT_EVENT_EVENT_LOOP_H
#define MQTT_EVENT_EVENT_LOOP_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace mqtt {
namespace event {

class Dispatcher;
class FileEvent;
class Timer;
class SignalEvent;

using DispatcherPtr = std::unique_ptr<Dispatcher>;
using FileEventPtr = std::unique_ptr<FileEvent>;
using TimerPtr = std::unique_ptr<Timer>;
using SignalEventPtr = std::unique_ptr<SignalEvent>;

using PostCb = std::function<void()>;
using FileReadyCb = std::function<void(uint32_t events)>;
using TimerCb = std::function<void()>;
using SignalCb = std::function<void()>;

// Socket readiness bits passed to FileReadyCb
enum class FileReadyType : uint32_t { Read = 0x01, Write = 0x02 };

inline uint32_t operator&(FileReadyType a, uint32_t b) {
  return static_cast<uint32_t>(a) & b;
}

enum class RunType {
  Block,        // Run until no more events
  NonBlock,     // Run one non-blocking iteration
  RunUntilExit  // Run until exit() is called
};

/**
 * Level-triggered readiness watch on one descriptor. The descriptor is not
 * owned.
 */
class FileEvent {
 public:
  virtual ~FileEvent() = default;

  // Invoke the callback with `events` on the next loop iteration
  virtual void activate(uint32_t events) = 0;

  // Replace the watched readiness bits; 0 stops watching
  virtual void setEnabled(uint32_t events) = 0;
};

/**
 * One-shot timer. Destroying it cancels a pending expiry.
 */
class Timer {
 public:
  virtual ~Timer() = default;

  virtual void disableTimer() = 0;

  // (Re)arm the timer, replacing any pending expiry
  virtual void enableTimer(std::chrono::milliseconds duration) = 0;

  virtual bool enabled() = 0;
};

class SignalEvent {
 public:
  virtual ~SignalEvent() = default;
};

/**
 * Single-threaded event loop.
 *
 * Every MQTT connection is confined to one dispatcher. Handler completions
 * that happen on other threads come back through post(). The loop binds to
 * the thread that calls run().
 */
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual const std::string& name() = 0;

  // Queue a callback for the loop thread. Callable from any thread.
  virtual void post(PostCb callback) = 0;

  // True when called on the thread currently bound by run()
  virtual bool isThreadSafe() const = 0;

  virtual FileEventPtr createFileEvent(int fd,
                                       FileReadyCb cb,
                                       uint32_t events) = 0;

  virtual TimerPtr createTimer(TimerCb cb) = 0;

  virtual SignalEventPtr listenForSignal(int signal_num, SignalCb cb) = 0;

  virtual void run(RunType type) = 0;

  // Stop RunUntilExit. Callable from any thread.
  virtual void exit() = 0;

  // Drop posted callbacks that have not run yet (loop thread only)
  virtual void shutdown() = 0;
};

class DispatcherFactory {
 public:
  virtual ~DispatcherFactory() = default;

  virtual DispatcherPtr createDispatcher(const std::string& name) = 0;

  virtual const std::string& backendName() const = 0;
};

using DispatcherFactoryPtr = std::unique_ptr<DispatcherFactory>;

DispatcherFactoryPtr createLibeventDispatcherFactory();

}  // namespace event
}  // namespace mqtt

#endif  // MQTT_EVENT_EVENT_LOOP_H
