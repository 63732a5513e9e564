#include "zipline/compression-test-helpers.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#ifdef ZIPLINE_ENABLE_ZLIB
#include <zconf.h>
#include <zlib.h>
#endif

#ifdef ZIPLINE_ENABLE_BROTLI
#include <brotli/decode.h>
#endif

namespace zipline::test {

std::string ZlibDecompress([[maybe_unused]] std::string_view compressed, [[maybe_unused]] bool isGzip) {
  std::string out;
#ifdef ZIPLINE_ENABLE_ZLIB
  z_stream stream{};
  if (inflateInit2(&stream, isGzip ? MAX_WBITS + 16 : MAX_WBITS) != Z_OK) {
    throw std::runtime_error("inflateInit2 failed");
  }
  stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(compressed.data()));
  stream.avail_in = static_cast<uInt>(compressed.size());

  char buf[4096];
  int ret;
  do {
    stream.next_out = reinterpret_cast<Bytef *>(buf);
    stream.avail_out = sizeof(buf);
    ret = inflate(&stream, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      inflateEnd(&stream);
      throw std::runtime_error("inflate failed");
    }
    out.append(buf, sizeof(buf) - stream.avail_out);
  } while (ret != Z_STREAM_END);
  inflateEnd(&stream);
#else
  throw std::runtime_error("zlib support is not built in");
#endif
  return out;
}

std::string BrotliDecompress([[maybe_unused]] std::string_view compressed) {
  std::string out;
#ifdef ZIPLINE_ENABLE_BROTLI
  BrotliDecoderState *state = BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
  if (state == nullptr) {
    throw std::runtime_error("BrotliDecoderCreateInstance failed");
  }
  const auto *nextIn = reinterpret_cast<const uint8_t *>(compressed.data());
  std::size_t availIn = compressed.size();
  uint8_t buf[4096];
  BrotliDecoderResult result;
  do {
    uint8_t *nextOut = buf;
    std::size_t availOut = sizeof(buf);
    result = BrotliDecoderDecompressStream(state, &availIn, &nextIn, &availOut, &nextOut, nullptr);
    out.append(reinterpret_cast<const char *>(buf), sizeof(buf) - availOut);
  } while (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT);
  BrotliDecoderDestroyInstance(state);
  if (result != BROTLI_DECODER_RESULT_SUCCESS) {
    throw std::runtime_error("Brotli decoding failed");
  }
#else
  throw std::runtime_error("brotli support is not built in");
#endif
  return out;
}

std::string MakePatternedPayload(std::size_t size) {
  std::string payload;
  payload.reserve(size);
  for (std::size_t pos = 0; pos < size; ++pos) {
    payload.push_back(static_cast<char>('a' + static_cast<int>(pos % 13U)));
  }
  return payload;
}

}  // namespace zipline::test
