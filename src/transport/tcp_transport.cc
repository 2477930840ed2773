#define MQTT_LOG_COMPONENT "transport.tcp"

#include "mqtt/transport/tcp_transport.h"

#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstring>
#include <vector>

#include "mqtt/logging/log_macros.h"

namespace mqtt {
namespace transport {

namespace {

constexpr size_t kReadSliceSize = 16384;

bool setNonBlocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags == -1) {
    return false;
  }
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

void setNoDelay(int fd) {
  int one = 1;
  // Fails harmlessly on socketpairs
  (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
}

}  // namespace

const char* connectionEventToString(ConnectionEvent event) {
  switch (event) {
    case ConnectionEvent::RemoteClose: return "RemoteClose";
    case ConnectionEvent::LocalClose: return "LocalClose";
  }
  return "Unknown";
}

TcpTransport::TcpTransport(event::Dispatcher& dispatcher, int fd)
    : dispatcher_(dispatcher), fd_(fd) {
  if (!setNonBlocking(fd_)) {
    MQTT_LOG(Warning, "Failed to set fd {} non-blocking: {}", fd_,
             std::strerror(errno));
  }
  setNoDelay(fd_);

  // Write interest is only enabled while there is buffered output
  enabled_events_ = static_cast<uint32_t>(event::FileReadyType::Read);
  file_event_ = dispatcher_.createFileEvent(
      fd_, [this](uint32_t events) { onFileEvent(events); }, enabled_events_);
}

TcpTransport::~TcpTransport() {
  file_event_.reset();
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

Result<TransportPtr> TcpTransport::connect(event::Dispatcher& dispatcher,
                                           const std::string& host,
                                           uint16_t port) {
  addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* results = nullptr;
  const std::string service = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
  if (rc != 0) {
    return Error(errors::IO_ERROR, "Failed to resolve " + host + ": " +
                                       ::gai_strerror(rc));
  }

  int fd = -1;
  std::string last_error = "no addresses";
  for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error = std::strerror(errno);
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      break;
    }
    last_error = std::strerror(errno);
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(results);

  if (fd < 0) {
    return Error(errors::IO_ERROR, "Failed to connect to " + host + ":" +
                                       service + ": " + last_error);
  }

  MQTT_LOG(Debug, "Connected to {}:{} on fd {}", host, port, fd);
  return TransportPtr(new TcpTransport(dispatcher, fd));
}

void TcpTransport::setTransportCallbacks(TransportCallbacks& callbacks) {
  callbacks_ = &callbacks;
}

VoidResult TcpTransport::write(Buffer& data) {
  if (fd_ < 0) {
    data.drain(data.length());
    return makeVoidError(Error(errors::DISCONNECTED, "Transport is closed"));
  }

  data.move(write_buffer_);
  // Writers may hold locks of their own; the close is reported from the loop
  if (!doWrite(true)) {
    return makeVoidError(Error(errors::IO_ERROR, "Socket write failed"));
  }
  return makeVoidSuccess();
}

void TcpTransport::close() {
  if (fd_ < 0) {
    return;
  }
  // Best effort flush of frames already accepted (e.g. a rejecting CONNACK)
  if (write_buffer_.length() > 0 && !doWrite(false)) {
    return;
  }
  if (write_buffer_.length() > 0) {
    MQTT_LOG(Debug, "Closing fd {} with {} unsent bytes", fd_,
             write_buffer_.length());
  }
  closeSocket(ConnectionEvent::LocalClose);
}

void TcpTransport::onFileEvent(uint32_t events) {
  if (events & static_cast<uint32_t>(event::FileReadyType::Write)) {
    if (!doWrite(false)) {
      return;
    }
  }

  if (fd_ >= 0 &&
      (events & static_cast<uint32_t>(event::FileReadyType::Read))) {
    doRead();
  }
}

void TcpTransport::doRead() {
  size_t total = 0;
  bool end_stream = false;
  bool failed = false;

  while (true) {
    RawSlice slice;
    read_buffer_.reserveSingleSlice(kReadSliceSize, slice);
    ssize_t n = ::read(fd_, slice.mem_, slice.len_);
    int err = errno;
    read_buffer_.commit(slice, n > 0 ? static_cast<size_t>(n) : 0);

    if (n > 0) {
      total += static_cast<size_t>(n);
      continue;
    }
    if (n == 0) {
      end_stream = true;
    } else if (err == EINTR) {
      continue;
    } else if (err != EAGAIN && err != EWOULDBLOCK) {
      MQTT_LOG(Debug, "Read on fd {} failed: {}", fd_, std::strerror(err));
      failed = true;
    }
    break;
  }

  if (total > 0 && callbacks_ != nullptr) {
    callbacks_->onData(read_buffer_);
  }

  // The callback may have closed the transport
  if (fd_ >= 0 && (end_stream || failed)) {
    closeSocket(ConnectionEvent::RemoteClose);
  }
}

bool TcpTransport::doWrite(bool defer_close) {
  while (write_buffer_.length() > 0) {
    size_t len = write_buffer_.length();
    const void* data = write_buffer_.linearize(len);
    ssize_t n = ::send(fd_, data, len, MSG_NOSIGNAL);
    if (n > 0) {
      write_buffer_.drain(static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      break;
    }
    MQTT_LOG(Debug, "Write on fd {} failed: {}", fd_, std::strerror(errno));
    closeSocket(ConnectionEvent::RemoteClose, defer_close);
    return false;
  }
  updateEvents();
  return true;
}

void TcpTransport::updateEvents() {
  uint32_t wanted = static_cast<uint32_t>(event::FileReadyType::Read);
  if (write_buffer_.length() > 0) {
    wanted |= static_cast<uint32_t>(event::FileReadyType::Write);
  }
  if (wanted != enabled_events_ && file_event_) {
    file_event_->setEnabled(wanted);
    enabled_events_ = wanted;
  }
}

void TcpTransport::closeSocket(ConnectionEvent event, bool defer_notify) {
  if (fd_ < 0) {
    return;
  }
  MQTT_LOG(Debug, "Closing fd {} ({})", fd_, connectionEventToString(event));
  file_event_.reset();
  ::close(fd_);
  fd_ = -1;
  write_buffer_.drain(write_buffer_.length());

  if (!defer_notify) {
    if (callbacks_ != nullptr) {
      callbacks_->onClose(event);
    }
    return;
  }

  std::weak_ptr<bool> alive = alive_;
  dispatcher_.post([this, alive, event]() {
    if (alive.lock() && callbacks_ != nullptr) {
      callbacks_->onClose(event);
    }
  });
}

}  // namespace transport
}  // namespace mqtt
