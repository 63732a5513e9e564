#pragma once

#include <brotli/encode.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>

#include "zipline/compression-config.hpp"
#include "zipline/encoder.hpp"
#include "zipline/media-type.hpp"
#include "zipline/raw-chars.hpp"

namespace zipline {

// Brotli mode hint for the given content type: text for text/*, font for font/*, generic otherwise.
BrotliEncoderMode BrotliModeFor(const std::optional<MediaType> &contentType) noexcept;

class BrotliEncoderContext final : public EncoderContext {
 public:
  BrotliEncoderContext(RawChars &sharedBuf, int quality, int window, BrotliEncoderMode mode);

  std::string_view encodeChunk(std::size_t encoderChunkSize, std::string_view chunk) override;

 private:
  std::unique_ptr<BrotliEncoderState, void (*)(BrotliEncoderState *)> _state;
  RawChars &_buf;
};

class BrotliEncoder final : public Encoder {
 public:
  explicit BrotliEncoder(BrotliEncoderMode mode = BROTLI_MODE_GENERIC,
                         int quality = CompressionConfig::Brotli::kQuality,
                         int window = CompressionConfig::Brotli::kWindow, std::size_t initialCapacity = 4096UL)
      : _buf(initialCapacity), _quality(quality), _window(window), _mode(mode) {}

  void encodeFull(std::string_view data, RawChars &buf) override;

  std::unique_ptr<EncoderContext> makeContext() override {
    return std::make_unique<BrotliEncoderContext>(_buf, _quality, _window, _mode);
  }

 private:
  RawChars _buf;
  int _quality;
  int _window;
  BrotliEncoderMode _mode;
};

}  // namespace zipline
