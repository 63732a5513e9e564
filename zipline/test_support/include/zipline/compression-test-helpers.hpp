#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace zipline::test {

constexpr bool HasGzipMagic(std::string_view body) {
  return body.size() >= 2 && static_cast<unsigned char>(body[0]) == 0x1f && static_cast<unsigned char>(body[1]) == 0x8b;
}

// Inflates a gzip (isGzip) or zlib-wrapped deflate stream. Throws std::runtime_error on corrupted input.
std::string ZlibDecompress(std::string_view compressed, bool isGzip = true);

// Decodes a complete brotli stream. Throws std::runtime_error on corrupted input.
std::string BrotliDecompress(std::string_view compressed);

// Deterministic, compressible payload of 'size' bytes.
std::string MakePatternedPayload(std::size_t size);

}  // namespace zipline::test
