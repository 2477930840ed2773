#ifndef MQTT_BUFFER_H
#define MQTT_BUFFER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>

namespace mqtt {

// Writable region handed out by reserveSingleSlice()
struct RawSlice {
  void* mem_ = nullptr;
  size_t len_ = 0;
};

/**
 * Byte queue used for frame assembly and socket I/O.
 *
 * Bytes are appended at the tail and consumed from the head. The decoder
 * reads whole frames through linearize(); the transport reads straight into
 * reserved tail space.
 */
class Buffer {
 public:
  virtual ~Buffer() = default;

  virtual void add(const void* data, size_t size) = 0;
  virtual void add(const std::string& data) = 0;
  virtual void add(const Buffer& data) = 0;

  // Remove `size` bytes from the head; throws if fewer are available
  virtual void drain(size_t size) = 0;

  // Append up to `length` head bytes to `destination` and drain them here
  virtual void move(Buffer& destination) = 0;
  virtual void move(Buffer& destination, size_t length) = 0;

  // Reserve writable space at the tail; commit() makes `size` bytes visible.
  // No other write is allowed while a reservation is pending.
  virtual void* reserveSingleSlice(size_t length, RawSlice& slice) = 0;
  virtual void commit(RawSlice& slice, size_t size) = 0;

  // Contiguous view of the first `size` bytes, valid until the next write
  virtual const void* linearize(size_t size) const = 0;

  virtual size_t copyOut(size_t start, size_t size, void* data) const = 0;

  virtual size_t length() const = 0;
  bool empty() const { return length() == 0; }

  virtual std::string toString() const = 0;

  // Append an unsigned integer in network byte order
  template <typename T>
  void writeBEInt(T value) {
    static_assert(std::is_unsigned<T>::value, "T must be unsigned");
    uint8_t bytes[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); ++i) {
      bytes[i] = static_cast<uint8_t>(value >> (8 * (sizeof(T) - 1 - i)));
    }
    add(bytes, sizeof(T));
  }
};

class OwnedBuffer : public Buffer {
 public:
  OwnedBuffer();
  OwnedBuffer(const OwnedBuffer&) = delete;
  OwnedBuffer& operator=(const OwnedBuffer&) = delete;
  OwnedBuffer(OwnedBuffer&& other) noexcept;
  OwnedBuffer& operator=(OwnedBuffer&& other) noexcept;
  ~OwnedBuffer() override;

  void add(const void* data, size_t size) override;
  void add(const std::string& data) override;
  void add(const Buffer& data) override;
  void drain(size_t size) override;
  void move(Buffer& destination) override;
  void move(Buffer& destination, size_t length) override;
  void* reserveSingleSlice(size_t length, RawSlice& slice) override;
  void commit(RawSlice& slice, size_t size) override;
  const void* linearize(size_t size) const override;
  size_t copyOut(size_t start, size_t size, void* data) const override;
  size_t length() const override;
  std::string toString() const override;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace mqtt

#endif  // MQTT_BUFFER_H
