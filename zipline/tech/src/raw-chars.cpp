#include "zipline/raw-chars.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <new>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace zipline {

RawChars::RawChars(size_type capacity) : _buf(static_cast<char *>(std::malloc(capacity))), _capacity(capacity) {
  if (capacity != 0 && _buf == nullptr) {
    throw std::bad_alloc();
  }
}

RawChars::RawChars(std::string_view data) : RawChars(data.size()) {
  if (!data.empty()) {
    std::memcpy(_buf, data.data(), data.size());
    _size = data.size();
  }
}

RawChars::RawChars(const RawChars &rhs) : RawChars(std::string_view(rhs)) {}

RawChars::RawChars(RawChars &&rhs) noexcept
    : _buf(std::exchange(rhs._buf, nullptr)),
      _size(std::exchange(rhs._size, 0)),
      _capacity(std::exchange(rhs._capacity, 0)) {}

RawChars &RawChars::operator=(const RawChars &rhs) {
  if (this != &rhs) {
    reserve(rhs.size());
    _size = rhs.size();
    if (!empty()) {
      std::memcpy(_buf, rhs.data(), _size);
    }
  }
  return *this;
}

RawChars &RawChars::operator=(RawChars &&rhs) noexcept {
  if (this != &rhs) {
    std::free(_buf);
    _buf = std::exchange(rhs._buf, nullptr);
    _size = std::exchange(rhs._size, 0);
    _capacity = std::exchange(rhs._capacity, 0);
  }
  return *this;
}

RawChars::~RawChars() { std::free(_buf); }

void RawChars::append(std::string_view data) {
  if (!data.empty()) {
    ensureAvailableCapacityExponential(data.size());
    std::memcpy(_buf + _size, data.data(), data.size());
    _size += data.size();
  }
}

void RawChars::setSize(size_type newSize) {
  if (newSize > _capacity) {
    throw std::out_of_range("RawChars::setSize beyond capacity");
  }
  _size = newSize;
}

void RawChars::addSize(size_type delta) { setSize(_size + delta); }

void RawChars::reserve(size_type newCapacity) {
  if (newCapacity > _capacity) {
    reallocUp(newCapacity);
  }
}

void RawChars::ensureAvailableCapacity(size_type availableCapacity) { reserve(_size + availableCapacity); }

void RawChars::ensureAvailableCapacityExponential(size_type availableCapacity) {
  const size_type required = _size + availableCapacity;
  if (required > _capacity) {
    reallocUp(std::max(required, _capacity * 2U));
  }
}

void RawChars::reallocUp(size_type newCapacity) {
  auto *newBuf = static_cast<char *>(std::realloc(_buf, newCapacity));
  if (newBuf == nullptr) {
    throw std::bad_alloc();
  }
  _buf = newBuf;
  _capacity = newCapacity;
}

}  // namespace zipline
