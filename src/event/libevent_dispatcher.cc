#define MQTT_LOG_COMPONENT "event.dispatcher"

#include "mqtt/event/libevent_dispatcher.h"

#include <stdexcept>
#include <utility>

#include <event2/event.h>
#include <event2/thread.h>

#include "mqtt/logging/log_macros.h"

namespace mqtt {
namespace event {

namespace {

short toLibeventEvents(uint32_t events) {
  short result = 0;
  if (FileReadyType::Read & events) {
    result |= EV_READ;
  }
  if (FileReadyType::Write & events) {
    result |= EV_WRITE;
  }
  return result;
}

uint32_t fromLibeventEvents(short events) {
  uint32_t result = 0;
  if (events & EV_READ) {
    result |= static_cast<uint32_t>(FileReadyType::Read);
  }
  if (events & EV_WRITE) {
    result |= static_cast<uint32_t>(FileReadyType::Write);
  }
  return result;
}

timeval toTimeval(std::chrono::milliseconds duration) {
  if (duration.count() < 0) {
    duration = std::chrono::milliseconds(0);
  }
  timeval tv;
  tv.tv_sec = static_cast<decltype(tv.tv_sec)>(duration.count() / 1000);
  tv.tv_usec = static_cast<decltype(tv.tv_usec)>((duration.count() % 1000) *
                                                 1000);
  return tv;
}

// Must run before the first event_base is created so that every base gets
// locks and a cross-thread notification channel
void ensureLibeventThreading() {
  static std::once_flag once;
  std::call_once(once, []() {
    if (evthread_use_pthreads() != 0) {
      throw std::runtime_error("libevent pthread support unavailable");
    }
  });
}

}  // namespace

// ===== File events =====

class LibeventDispatcher::FileEventImpl : public FileEvent {
 public:
  FileEventImpl(LibeventDispatcher& dispatcher,
                int fd,
                FileReadyCb cb,
                uint32_t events)
      : dispatcher_(dispatcher), fd_(fd), cb_(std::move(cb)) {
    event_ = event_new(dispatcher_.base(), fd_, 0, &FileEventImpl::onReady,
                       this);
    if (event_ == nullptr) {
      throw std::runtime_error("Failed to create file event");
    }
    setEnabled(events);
  }

  ~FileEventImpl() override {
    event_del(event_);
    event_free(event_);
  }

  void activate(uint32_t events) override {
    short what = toLibeventEvents(events);
    if (what != 0) {
      event_active(event_, what, 0);
    }
  }

  void setEnabled(uint32_t events) override {
    if (added_ && events == enabled_) {
      return;
    }
    enabled_ = events;
    if (added_) {
      event_del(event_);
      added_ = false;
    }
    if (events == 0) {
      return;
    }
    event_assign(event_, dispatcher_.base(), fd_,
                 toLibeventEvents(events) | EV_PERSIST,
                 &FileEventImpl::onReady, this);
    if (event_add(event_, nullptr) != 0) {
      MQTT_LOG(Error, "[{}] event_add failed for fd {}", dispatcher_.name(),
               fd_);
      return;
    }
    added_ = true;
  }

 private:
  static void onReady(evutil_socket_t, short what, void* arg) {
    auto* self = static_cast<FileEventImpl*>(arg);
    uint32_t ready = fromLibeventEvents(what);
    if (ready != 0) {
      self->cb_(ready);
    }
  }

  LibeventDispatcher& dispatcher_;
  int fd_;
  FileReadyCb cb_;
  struct event* event_{nullptr};
  uint32_t enabled_{0};
  bool added_{false};
};

// ===== Timers =====

class LibeventDispatcher::TimerImpl : public Timer {
 public:
  TimerImpl(LibeventDispatcher& dispatcher, TimerCb cb) : cb_(std::move(cb)) {
    event_ = evtimer_new(dispatcher.base(), &TimerImpl::onExpired, this);
    if (event_ == nullptr) {
      throw std::runtime_error("Failed to create timer");
    }
  }

  ~TimerImpl() override {
    event_del(event_);
    event_free(event_);
  }

  void disableTimer() override {
    if (enabled_) {
      event_del(event_);
      enabled_ = false;
    }
  }

  void enableTimer(std::chrono::milliseconds duration) override {
    timeval tv = toTimeval(duration);
    enabled_ = evtimer_add(event_, &tv) == 0;
  }

  bool enabled() override { return enabled_; }

 private:
  static void onExpired(evutil_socket_t, short, void* arg) {
    auto* self = static_cast<TimerImpl*>(arg);
    self->enabled_ = false;
    self->cb_();
  }

  TimerCb cb_;
  struct event* event_{nullptr};
  bool enabled_{false};
};

// ===== Signals =====

class LibeventDispatcher::SignalEventImpl : public SignalEvent {
 public:
  SignalEventImpl(LibeventDispatcher& dispatcher, int signal_num, SignalCb cb)
      : cb_(std::move(cb)) {
    event_ = evsignal_new(dispatcher.base(), signal_num,
                          &SignalEventImpl::onSignal, this);
    if (event_ == nullptr || event_add(event_, nullptr) != 0) {
      if (event_ != nullptr) {
        event_free(event_);
      }
      throw std::runtime_error("Failed to watch signal " +
                               std::to_string(signal_num));
    }
  }

  ~SignalEventImpl() override {
    event_del(event_);
    event_free(event_);
  }

 private:
  static void onSignal(evutil_socket_t, short, void* arg) {
    static_cast<SignalEventImpl*>(arg)->cb_();
  }

  SignalCb cb_;
  struct event* event_{nullptr};
};

// ===== Dispatcher =====

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  ensureLibeventThreading();

  event_config* config = event_config_new();
  if (config != nullptr) {
    event_config_set_flag(config, EVENT_BASE_FLAG_PRECISE_TIMER);
    base_ = event_base_new_with_config(config);
    event_config_free(config);
  }
  if (base_ == nullptr) {
    throw std::runtime_error("Failed to create event base");
  }

  post_event_ =
      event_new(base_, -1, 0, &LibeventDispatcher::onPostActivated, this);
  if (post_event_ == nullptr) {
    event_base_free(base_);
    throw std::runtime_error("Failed to create post event");
  }

  const char* method = event_base_get_method(base_);
  MQTT_LOG(Debug, "Dispatcher '{}' using libevent {} ({})", name_,
           event_get_version(), method != nullptr ? method : "unknown");
}

LibeventDispatcher::~LibeventDispatcher() {
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    post_callbacks_.clear();
  }
  event_free(post_event_);
  event_base_free(base_);
}

void LibeventDispatcher::post(PostCb callback) {
  bool first = false;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    first = post_callbacks_.empty();
    post_callbacks_.push_back(std::move(callback));
  }
  // One activation drains the whole queue
  if (first) {
    event_active(post_event_, EV_READ, 0);
  }
}

bool LibeventDispatcher::isThreadSafe() const {
  std::thread::id bound = thread_id_.load();
  return bound != std::thread::id() && bound == std::this_thread::get_id();
}

FileEventPtr LibeventDispatcher::createFileEvent(int fd,
                                                 FileReadyCb cb,
                                                 uint32_t events) {
  return std::make_unique<FileEventImpl>(*this, fd, std::move(cb), events);
}

TimerPtr LibeventDispatcher::createTimer(TimerCb cb) {
  return std::make_unique<TimerImpl>(*this, std::move(cb));
}

SignalEventPtr LibeventDispatcher::listenForSignal(int signal_num,
                                                   SignalCb cb) {
  return std::make_unique<SignalEventImpl>(*this, signal_num, std::move(cb));
}

void LibeventDispatcher::run(RunType type) {
  exit_requested_ = false;
  thread_id_ = std::this_thread::get_id();

  runPostCallbacks();

  switch (type) {
    case RunType::Block:
      event_base_loop(base_, 0);
      break;
    case RunType::NonBlock:
      event_base_loop(base_, EVLOOP_NONBLOCK);
      break;
    case RunType::RunUntilExit:
      while (!exit_requested_) {
        event_base_loop(base_, EVLOOP_ONCE | EVLOOP_NO_EXIT_ON_EMPTY);
        runPostCallbacks();
      }
      return;
  }
  runPostCallbacks();
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;
  if (isThreadSafe()) {
    event_base_loopbreak(base_);
  } else {
    // Wake the loop so it sees the flag
    post([]() {});
  }
}

void LibeventDispatcher::shutdown() {
  if (!isThreadSafe()) {
    return;
  }
  std::deque<PostCb> dropped;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    dropped.swap(post_callbacks_);
  }
  if (!dropped.empty()) {
    MQTT_LOG(Debug, "Dispatcher '{}' dropped {} posted callbacks", name_,
             dropped.size());
  }
}

void LibeventDispatcher::onPostActivated(evutil_socket_t, short, void* arg) {
  static_cast<LibeventDispatcher*>(arg)->runPostCallbacks();
}

void LibeventDispatcher::runPostCallbacks() {
  std::deque<PostCb> callbacks;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    callbacks.swap(post_callbacks_);
  }
  // Callbacks posted from here land in the next batch
  for (auto& callback : callbacks) {
    callback();
  }
}

// ===== Factory =====

DispatcherPtr LibeventDispatcherFactory::createDispatcher(
    const std::string& name) {
  return std::make_unique<LibeventDispatcher>(name);
}

const std::string& LibeventDispatcherFactory::backendName() const {
  static const std::string name = "libevent";
  return name;
}

DispatcherFactoryPtr createLibeventDispatcherFactory() {
  return std::make_unique<LibeventDispatcherFactory>();
}

}  // namespace event
}  // namespace mqtt
