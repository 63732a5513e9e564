#pragma once

#include <cstddef>
#include <string_view>

namespace zipline {

/**
 * A simple character buffer managing a dynamically allocated block.
 * It is designed to be used by compression libraries (zlib, brotli) that require a low-level
 * "write at end, then commit the written size" interface. Do not use it for general-purpose
 * data storage (prefer std::string in that case).
 */
class RawChars {
 public:
  using value_type = char;
  using size_type = std::size_t;

  RawChars() noexcept = default;

  explicit RawChars(size_type capacity);

  explicit RawChars(std::string_view data);

  RawChars(const RawChars &rhs);
  RawChars(RawChars &&rhs) noexcept;

  RawChars &operator=(const RawChars &rhs);
  RawChars &operator=(RawChars &&rhs) noexcept;

  ~RawChars();

  void append(std::string_view data);

  void clear() noexcept { _size = 0; }

  void setSize(size_type newSize);

  void addSize(size_type delta);

  [[nodiscard]] size_type size() const noexcept { return _size; }

  [[nodiscard]] size_type capacity() const noexcept { return _capacity; }

  [[nodiscard]] size_type availableCapacity() const noexcept { return _capacity - _size; }

  void reserve(size_type newCapacity);

  // Makes sure that at least 'availableCapacity' bytes can be written after size() without reallocation.
  void ensureAvailableCapacity(size_type availableCapacity);

  // Same as ensureAvailableCapacity, but growth is at least exponential.
  void ensureAvailableCapacityExponential(size_type availableCapacity);

  [[nodiscard]] char *data() noexcept { return _buf; }
  [[nodiscard]] const char *data() const noexcept { return _buf; }

  [[nodiscard]] bool empty() const noexcept { return _size == 0; }

  operator std::string_view() const noexcept { return {_buf, _size}; }

  bool operator==(const RawChars &rhs) const noexcept {
    return std::string_view(*this) == std::string_view(rhs);
  }

 private:
  void reallocUp(size_type newCapacity);

  char *_buf = nullptr;
  size_type _size = 0;
  size_type _capacity = 0;
};

}  // namespace zipline
