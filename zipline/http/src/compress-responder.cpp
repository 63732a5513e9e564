#include "zipline/compress-responder.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include "zipline/compression-config.hpp"
#include "zipline/compression-negotiation.hpp"
#include "zipline/http-request.hpp"
#include "zipline/http-response.hpp"
#include "zipline/response-compressor.hpp"

namespace zipline {

namespace {

struct UnrestrictedCompression {
  explicit UnrestrictedCompression(const CompressionConfig &config) : negotiator(config, {}), compressor(config) {}

  void operator()(const HttpRequest &request, HttpResponse &response) const {
    const auto encoding = negotiator.decide(request, response);
    if (encoding) {
      compressor.apply(response, *encoding);
    }
  }

  CompressionNegotiator negotiator;
  ResponseCompressor compressor;
};

}  // namespace

void CompressResponse(const HttpRequest &request, HttpResponse &response, const CompressionConfig &config) {
  const UnrestrictedCompression compression(config);
  compression(request, response);
}

RequestHandler Compress(RequestHandler handler, const CompressionConfig &config) {
  if (!handler) {
    throw std::invalid_argument("Cannot wrap an empty handler");
  }
  auto compression = std::make_shared<const UnrestrictedCompression>(config);
  return [handler = std::move(handler), compression = std::move(compression)](const HttpRequest &request) {
    HttpResponse response = handler(request);
    (*compression)(request, response);
    return response;
  };
}

}  // namespace zipline
