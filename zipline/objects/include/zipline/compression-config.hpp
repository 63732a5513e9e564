#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include "zipline/features.hpp"
#include "zipline/media-type.hpp"

#ifdef ZIPLINE_ENABLE_ZLIB
#include <zlib.h>
#endif

#ifdef ZIPLINE_ENABLE_BROTLI
#include <brotli/encode.h>
#endif

namespace zipline {

// How the compressed body consumes the original one.
enum class BodyCompressionMode : std::uint8_t {
  // Read the whole original body into memory on first pull, then compress it in one shot.
  buffered,
  // Pipe the original body through a streaming encoder context, chunk by chunk.
  streaming,
};

// NOTE: Compression is optional at build time. When ZIPLINE_ENABLE_ZLIB (resp. ZIPLINE_ENABLE_BROTLI) is not
// defined, gzip (resp. brotli) cannot be enabled and validate() refuses a configuration asking for it.
struct CompressionConfig {
  // Content types never compressed by default.
  static constexpr std::string_view kDefaultExcludedContentTypes[] = {
      "application/gzip", "application/zip",  "image/*",
      "video/*",          "application/wasm", "application/octet-stream",
  };

  // Throws std::invalid_argument if the configuration is invalid.
  void validate() const;

  // Same as validate(), excluding 'excludedContentTypes'.
  void validateCodecs() const;

  // Parses 'excludedContentTypes' in order.
  // Throws std::invalid_argument on the first malformed pattern.
  [[nodiscard]] std::vector<MediaType> parseExclusions() const;

  // Replaces (does not merge with) the current exclusion patterns.
  CompressionConfig& withExcludedContentTypes(std::initializer_list<std::string_view> patterns);

  CompressionConfig& withGzip(bool on = true);

  CompressionConfig& withBrotli(bool on = true);

  CompressionConfig& withMode(BodyCompressionMode bodyMode);

  // Ordered list of content type patterns that must never be compressed.
  // Each entry is either 'type/subtype', 'type/*' or an extension shorthand ('json', 'wasm', ...).
  std::vector<std::string> excludedContentTypes =
      std::vector<std::string>(std::begin(kDefaultExcludedContentTypes), std::end(kDefaultExcludedContentTypes));

  bool enableGzip{zlibEnabled()};

  // Brotli is preferred over gzip when both are enabled and accepted by the client.
  bool enableBrotli{false};

  BodyCompressionMode mode{BodyCompressionMode::buffered};

  // Chunk size of buffer growths during compression, and of reads in streaming mode.
  std::size_t encoderChunkSize{64UL * 1024UL};

  // Fixed presets, not meant to be tuned per deployment.
  struct Zlib {
#ifdef ZIPLINE_ENABLE_ZLIB
    static constexpr int8_t kLevel = Z_DEFAULT_COMPRESSION;
#else
    static constexpr int8_t kLevel = 0;
#endif
  };

  struct Brotli {
    static constexpr int8_t kQuality = 2;
#ifdef ZIPLINE_ENABLE_BROTLI
    static constexpr int8_t kWindow = BROTLI_DEFAULT_WINDOW;
#else
    static constexpr int8_t kWindow = 0;
#endif
  };
};

}  // namespace zipline
