#include "zipline/compression-negotiation.hpp"

#include <optional>
#include <ranges>
#include <string_view>
#include <utility>
#include <vector>

#include "zipline/compression-config.hpp"
#include "zipline/encoding.hpp"
#include "zipline/features.hpp"
#include "zipline/http-constants.hpp"
#include "zipline/http-request.hpp"
#include "zipline/http-response.hpp"
#include "zipline/log.hpp"
#include "zipline/media-type.hpp"
#include "zipline/string-trim.hpp"

namespace zipline {

bool AcceptsEncoding(const HttpRequest &request, std::string_view token) {
  bool accepted = false;
  request.headers().forEachValue(http::AcceptEncoding, [&accepted, token](std::string_view acceptEncoding) {
    for (auto part : acceptEncoding | std::views::split(',')) {
      if (TrimOws(std::string_view(part.begin(), part.end())) == token) {
        accepted = true;
        return;
      }
    }
  });
  return accepted;
}

CompressionNegotiator::CompressionNegotiator() : CompressionNegotiator(CompressionConfig{}) {}

CompressionNegotiator::CompressionNegotiator(const CompressionConfig &config)
    : CompressionNegotiator(config, config.parseExclusions()) {}

CompressionNegotiator::CompressionNegotiator(const CompressionConfig &config, std::vector<MediaType> exclusions)
    : _exclusions(std::move(exclusions)),
      _gzipEnabled(config.enableGzip && zlibEnabled()),
      _brotliEnabled(config.enableBrotli && zipline::brotliEnabled()) {
  config.validateCodecs();
}

std::optional<Encoding> CompressionNegotiator::decide(const HttpRequest &request, const HttpResponse &response) const {
  if (const auto contentEncoding = response.headerValue(http::ContentEncoding)) {
    log::debug("Response already encoded with '{}', not compressing", *contentEncoding);
    return std::nullopt;
  }

  const auto contentType = response.contentType();
  if (IsExcluded(contentType, _exclusions)) {
    log::debug("Content type '{}' is excluded from compression", contentType->str());
    return std::nullopt;
  }

  if (_brotliEnabled && AcceptsEncoding(request, http::br)) {
    return Encoding::Type::br;
  }
  if (_gzipEnabled && AcceptsEncoding(request, http::gzip)) {
    return Encoding::Type::gzip;
  }
  return std::nullopt;
}

}  // namespace zipline
