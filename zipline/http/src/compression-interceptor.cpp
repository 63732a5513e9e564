#include "zipline/compression-interceptor.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "zipline/compression-negotiation.hpp"
#include "zipline/http-request.hpp"
#include "zipline/http-response.hpp"
#include "zipline/log.hpp"
#include "zipline/response-compressor.hpp"
#include "zipline/server-config.hpp"

namespace zipline {

void CompressionInterceptor::onStartup(const ServerConfig &config) {
  try {
    CompressionNegotiator negotiator(config.compression);
    _negotiator = std::move(negotiator);
  } catch (const std::invalid_argument &ex) {
    log::critical("Invalid compression configuration: {}", ex.what());
    throw;
  }
  _compressor = ResponseCompressor(config.compression);

  std::string exclusions;
  for (const auto &mediaType : _negotiator.exclusions()) {
    if (!exclusions.empty()) {
      exclusions.append(", ");
    }
    exclusions.append(mediaType.str());
  }
  log::info("{} enabled (gzip: {}, brotli: {}), excluded content types: [{}]", kName, _negotiator.gzipEnabled(),
            _negotiator.brotliEnabled(), exclusions);
}

void CompressionInterceptor::onResponse(const HttpRequest &request, HttpResponse &response) {
  const auto encoding = _negotiator.decide(request, response);
  if (encoding) {
    _compressor.apply(response, *encoding);
  }
}

}  // namespace zipline
