#pragma once

#include <cstddef>

#include "zipline/compression-config.hpp"
#include "zipline/encoding.hpp"
#include "zipline/http-response.hpp"

namespace zipline {

// Replaces the body of a response by its lazily compressed version.
class ResponseCompressor {
 public:
  ResponseCompressor() noexcept = default;

  explicit ResponseCompressor(const CompressionConfig &config) noexcept
      : _encoderChunkSize(config.encoderChunkSize), _mode(config.mode) {}

  // Takes the body of 'response', wraps it into a CompressedBody and sets Content-Encoding to 'encoding'.
  // Any Content-Length header is removed, as it described the original body.
  // Returns false, leaving the response untouched, if it has no body or if no encoder exists for 'encoding' in
  // this build. Content-Encoding is set iff the body has been replaced.
  // If an allocation fails, the exception propagates and the response keeps its original headers and body.
  // Read and compression errors are not thrown here: they are reported by the new body when it is consumed.
  bool apply(HttpResponse &response, const Encoding &encoding) const;

  [[nodiscard]] BodyCompressionMode mode() const noexcept { return _mode; }

 private:
  std::size_t _encoderChunkSize{CompressionConfig{}.encoderChunkSize};
  BodyCompressionMode _mode{BodyCompressionMode::buffered};
};

}  // namespace zipline
