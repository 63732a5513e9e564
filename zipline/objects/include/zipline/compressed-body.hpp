#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>

#include "zipline/body-producer.hpp"
#include "zipline/compression-config.hpp"
#include "zipline/encoder.hpp"
#include "zipline/encoding.hpp"
#include "zipline/raw-chars.hpp"

namespace zipline {

// Lazy compressed view of another body, which it owns.
// Nothing is read from the source body before the first pull.
//  - buffered mode: the first pull drains the source, compresses it in one shot and returns it as a single unit.
//  - streaming mode: each pull reads source chunks until the encoder emits some output.
// A source failure (Failure unit or exception) or an encoder error is reported as a single Failure unit, after
// which the body ends. The source is never read again after a failure.
class CompressedBody final : public BodyProducer {
 public:
  CompressedBody(std::unique_ptr<BodyProducer> source, std::unique_ptr<Encoder> encoder, Encoding encoding,
                 BodyCompressionMode mode, std::size_t encoderChunkSize);

  BodyChunk next() override;

  // Installs the body to compress, if not given at construction. Must be called before the first pull.
  void setSource(std::unique_ptr<BodyProducer> source) noexcept { _source = std::move(source); }

  [[nodiscard]] const Encoding &encoding() const noexcept { return _encoding; }

 private:
  enum class State : std::uint8_t { pending, producing, done };

  BodyChunk nextBuffered();

  BodyChunk nextStreaming();

  BodyChunk fail(std::string_view reason);

  std::unique_ptr<BodyProducer> _source;
  std::unique_ptr<Encoder> _encoder;
  // Declared after _encoder as it may reference its shared buffer.
  std::unique_ptr<EncoderContext> _context;
  RawChars _out;
  Encoding _encoding;
  std::size_t _encoderChunkSize;
  BodyCompressionMode _mode;
  State _state{State::pending};
};

}  // namespace zipline
