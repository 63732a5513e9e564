#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace zipline {

// One unit of a lazily produced body: some bytes, the end of the body, or a failure.
// Failures are data here, so that a body can report a late error to whoever consumes it.
class BodyChunk {
 public:
  enum class Kind : std::uint8_t { data, end, failure };

  // The view must stay valid until the next pull on the producer that returned it.
  static BodyChunk Data(std::string_view data) noexcept { return BodyChunk(Kind::data, data); }

  static BodyChunk End() noexcept { return BodyChunk(Kind::end, {}); }

  static BodyChunk Failure(std::string message) {
    BodyChunk ret(Kind::failure, {});
    ret._error = std::move(message);
    return ret;
  }

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

  [[nodiscard]] bool isData() const noexcept { return _kind == Kind::data; }
  [[nodiscard]] bool isEnd() const noexcept { return _kind == Kind::end; }
  [[nodiscard]] bool isFailure() const noexcept { return _kind == Kind::failure; }

  [[nodiscard]] std::string_view data() const noexcept { return _data; }

  [[nodiscard]] std::string_view error() const noexcept { return _error; }

 private:
  BodyChunk(Kind kind, std::string_view data) noexcept : _data(data), _kind(kind) {}

  std::string_view _data;
  std::string _error;
  Kind _kind;
};

// Abstract lazy byte producer, owning its data.
// Contract: next() returns Data units until exactly one End or Failure unit, after which it returns End forever.
// Not thread-safe: a body is owned by a single response.
class BodyProducer {
 public:
  virtual ~BodyProducer() = default;

  virtual BodyChunk next() = 0;
};

// Body held in memory, yielded in slices of at most 'chunkSize' bytes (0 means all at once).
class InMemoryBody final : public BodyProducer {
 public:
  explicit InMemoryBody(std::string data, std::size_t chunkSize = 0) noexcept
      : _data(std::move(data)), _chunkSize(chunkSize) {}

  BodyChunk next() override;

 private:
  std::string _data;
  std::size_t _chunkSize;
  std::size_t _pos{};
};

// Body produced by a user generator. The generator is not called anymore once it returned End or Failure.
class CallbackBody final : public BodyProducer {
 public:
  using Generator = std::function<BodyChunk()>;

  explicit CallbackBody(Generator generator) noexcept : _generator(std::move(generator)) {}

  BodyChunk next() override;

 private:
  Generator _generator;
  bool _done{false};
};

struct BodyReadResult {
  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

  std::string data;
  std::optional<std::string> error;
};

// Drains 'producer' until its end or its first failure.
BodyReadResult ReadAll(BodyProducer &producer);

}  // namespace zipline
