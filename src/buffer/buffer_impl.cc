#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <vector>

#include "mqtt/buffer.h"

namespace mqtt {

namespace {

// Consumed prefix is compacted away once it dominates the storage
constexpr size_t kCompactThreshold = 4096;

}  // namespace

// Contiguous storage with a moving read head. Readers see
// [head_, storage_.size() - reserved_).
class OwnedBuffer::Impl {
 public:
  void add(const void* data, size_t size) {
    if (size == 0) {
      return;
    }
    if (reserved_ != 0) {
      throw std::runtime_error("Cannot add to buffer with pending reservation");
    }
    const auto* bytes = static_cast<const uint8_t*>(data);
    storage_.insert(storage_.end(), bytes, bytes + size);
  }

  void drain(size_t size) {
    if (size > length()) {
      throw std::runtime_error("Cannot drain more than buffer length");
    }
    head_ += size;
    if (length() == 0 && reserved_ == 0) {
      storage_.clear();
      head_ = 0;
    } else if (head_ >= kCompactThreshold && head_ * 2 >= storage_.size()) {
      compact();
    }
  }

  void* reserve(size_t size) {
    if (reserved_ != 0) {
      throw std::runtime_error("Buffer already has a pending reservation");
    }
    storage_.resize(storage_.size() + size);
    reserved_ = size;
    return storage_.data() + storage_.size() - size;
  }

  void commit(size_t size) {
    if (size > reserved_) {
      throw std::runtime_error("Cannot commit more than reserved");
    }
    storage_.resize(storage_.size() - reserved_ + size);
    reserved_ = 0;
  }

  uint8_t* data() { return storage_.data() + head_; }
  const uint8_t* data() const { return storage_.data() + head_; }

  size_t length() const { return storage_.size() - head_ - reserved_; }

 private:
  void compact() {
    storage_.erase(storage_.begin(), storage_.begin() + head_);
    head_ = 0;
  }

  std::vector<uint8_t> storage_;
  size_t head_{0};
  size_t reserved_{0};
};

OwnedBuffer::OwnedBuffer() : impl_(std::make_unique<Impl>()) {}

OwnedBuffer::OwnedBuffer(OwnedBuffer&& other) noexcept = default;

OwnedBuffer& OwnedBuffer::operator=(OwnedBuffer&& other) noexcept = default;

OwnedBuffer::~OwnedBuffer() = default;

void OwnedBuffer::add(const void* data, size_t size) { impl_->add(data, size); }

void OwnedBuffer::add(const std::string& data) {
  impl_->add(data.data(), data.size());
}

void OwnedBuffer::add(const Buffer& data) {
  const size_t len = data.length();
  if (len == 0) {
    return;
  }
  std::vector<uint8_t> tmp(len);
  data.copyOut(0, len, tmp.data());
  impl_->add(tmp.data(), len);
}

void OwnedBuffer::drain(size_t size) { impl_->drain(size); }

void OwnedBuffer::move(Buffer& destination) { move(destination, length()); }

void OwnedBuffer::move(Buffer& destination, size_t length) {
  length = std::min(length, impl_->length());
  destination.add(impl_->data(), length);
  impl_->drain(length);
}

void* OwnedBuffer::reserveSingleSlice(size_t length, RawSlice& slice) {
  slice.mem_ = impl_->reserve(length);
  slice.len_ = length;
  return slice.mem_;
}

void OwnedBuffer::commit(RawSlice& slice, size_t size) {
  impl_->commit(size);
  slice.mem_ = nullptr;
  slice.len_ = 0;
}

const void* OwnedBuffer::linearize(size_t size) const {
  if (size > impl_->length()) {
    throw std::runtime_error("Cannot linearize more than buffer length");
  }
  return impl_->data();
}

size_t OwnedBuffer::length() const { return impl_->length(); }

size_t OwnedBuffer::copyOut(size_t start, size_t size, void* data) const {
  const size_t len = impl_->length();
  if (start >= len) {
    return 0;
  }
  size = std::min(size, len - start);
  std::memcpy(data, impl_->data() + start, size);
  return size;
}

std::string OwnedBuffer::toString() const {
  return std::string(reinterpret_cast<const char*>(impl_->data()),
                     impl_->length());
}

}  // namespace mqtt
