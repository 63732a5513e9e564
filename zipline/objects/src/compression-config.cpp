#include "zipline/compression-config.hpp"

#include <format>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "zipline/features.hpp"
#include "zipline/media-type.hpp"

namespace zipline {

void CompressionConfig::validate() const {
  validateCodecs();
  [[maybe_unused]] auto exclusions = parseExclusions();
}

void CompressionConfig::validateCodecs() const {
  if (encoderChunkSize == 0) {
    throw std::invalid_argument("Invalid encoder chunk size");
  }
  if (enableGzip && !zlibEnabled()) {
    throw std::invalid_argument("gzip compression requested but zlib support is not built in");
  }
  if (enableBrotli && !brotliEnabled()) {
    throw std::invalid_argument("brotli compression requested but brotli support is not built in");
  }
}

std::vector<MediaType> CompressionConfig::parseExclusions() const {
  std::vector<MediaType> exclusions;
  exclusions.reserve(excludedContentTypes.size());
  for (const auto& pattern : excludedContentTypes) {
    auto mediaType = MediaType::ParseFlexible(pattern);
    if (!mediaType) {
      throw std::invalid_argument(std::format("Invalid excluded content type '{}'", pattern));
    }
    exclusions.push_back(std::move(*mediaType));
  }
  return exclusions;
}

CompressionConfig& CompressionConfig::withExcludedContentTypes(std::initializer_list<std::string_view> patterns) {
  excludedContentTypes.assign(patterns.begin(), patterns.end());
  return *this;
}

CompressionConfig& CompressionConfig::withGzip(bool on) {
  enableGzip = on;
  return *this;
}

CompressionConfig& CompressionConfig::withBrotli(bool on) {
  enableBrotli = on;
  return *this;
}

CompressionConfig& CompressionConfig::withMode(BodyCompressionMode bodyMode) {
  mode = bodyMode;
  return *this;
}

}  // namespace zipline
