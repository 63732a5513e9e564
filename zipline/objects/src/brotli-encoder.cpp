#include "zipline/brotli-encoder.hpp"

#include <brotli/encode.h>
#include <brotli/types.h>

#include <cstddef>
#include <cstdint>
#include <new>
#include <optional>
#include <stdexcept>
#include <string_view>

#include "zipline/media-type.hpp"
#include "zipline/raw-chars.hpp"
#include "zipline/string-equal-ignore-case.hpp"

namespace zipline {

BrotliEncoderMode BrotliModeFor(const std::optional<MediaType> &contentType) noexcept {
  if (contentType) {
    if (CaseInsensitiveEqual(contentType->top(), "text")) {
      return BROTLI_MODE_TEXT;
    }
    if (CaseInsensitiveEqual(contentType->top(), "font")) {
      return BROTLI_MODE_FONT;
    }
  }
  return BROTLI_MODE_GENERIC;
}

BrotliEncoderContext::BrotliEncoderContext(RawChars &sharedBuf, int quality, int window, BrotliEncoderMode mode)
    : _state(BrotliEncoderCreateInstance(nullptr, nullptr, nullptr), &BrotliEncoderDestroyInstance), _buf(sharedBuf) {
  if (!_state) {
    throw std::bad_alloc();
  }
  if (BrotliEncoderSetParameter(_state.get(), BROTLI_PARAM_QUALITY, static_cast<uint32_t>(quality)) == BROTLI_FALSE) {
    throw std::invalid_argument("Brotli set quality failed");
  }
  if (BrotliEncoderSetParameter(_state.get(), BROTLI_PARAM_LGWIN, static_cast<uint32_t>(window)) == BROTLI_FALSE) {
    throw std::invalid_argument("Brotli set window failed");
  }
  if (BrotliEncoderSetParameter(_state.get(), BROTLI_PARAM_MODE, static_cast<uint32_t>(mode)) == BROTLI_FALSE) {
    throw std::invalid_argument("Brotli set mode failed");
  }
}

std::string_view BrotliEncoderContext::encodeChunk(std::size_t encoderChunkSize, std::string_view chunk) {
  const uint8_t *nextIn = reinterpret_cast<const uint8_t *>(chunk.data());
  const BrotliEncoderOperation op = chunk.empty() ? BROTLI_OPERATION_FINISH : BROTLI_OPERATION_PROCESS;
  std::size_t availIn = chunk.size();

  for (_buf.clear();;) {
    _buf.ensureAvailableCapacityExponential(encoderChunkSize);

    uint8_t *nextOut = reinterpret_cast<uint8_t *>(_buf.data() + _buf.size());
    std::size_t availOut = _buf.availableCapacity();

    if (BrotliEncoderCompressStream(_state.get(), op, &availIn, &nextIn, &availOut, &nextOut, nullptr) ==
        BROTLI_FALSE) {
      throw std::runtime_error("BrotliEncoderCompressStream failed");
    }
    _buf.setSize(_buf.capacity() - availOut);

    if (chunk.empty()) {
      // Finishing mode: done only when the encoder reports the stream finished
      if (BrotliEncoderIsFinished(_state.get()) == BROTLI_TRUE) {
        break;
      }
    } else if (availIn == 0 && BrotliEncoderHasMoreOutput(_state.get()) == BROTLI_FALSE) {
      break;
    }
  }
  return _buf;
}

void BrotliEncoder::encodeFull(std::string_view data, RawChars &buf) {
  const auto oldSize = buf.size();
  const std::size_t maxCompressedSize = BrotliEncoderMaxCompressedSize(data.size());
  if (maxCompressedSize == 0) {
    throw std::runtime_error("Input too large for brotli compression");
  }

  buf.ensureAvailableCapacity(maxCompressedSize);

  auto *dst = reinterpret_cast<uint8_t *>(buf.data() + oldSize);
  std::size_t outSize = maxCompressedSize;

  if (BrotliEncoderCompress(_quality, _window, _mode, data.size(), reinterpret_cast<const uint8_t *>(data.data()),
                            &outSize, dst) == BROTLI_FALSE) {
    throw std::runtime_error("BrotliEncoderCompress failed");
  }

  buf.setSize(oldSize + outSize);
}

}  // namespace zipline
