#include "zipline/response-compressor.hpp"

#include <memory>
#include <utility>

#include "zipline/compressed-body.hpp"
#include "zipline/encoder-factory.hpp"
#include "zipline/encoding.hpp"
#include "zipline/http-constants.hpp"
#include "zipline/http-response.hpp"
#include "zipline/log.hpp"

namespace zipline {

bool ResponseCompressor::apply(HttpResponse &response, const Encoding &encoding) const {
  if (!response.hasBody()) {
    return false;
  }
  auto encoder = MakeEncoder(encoding, response.contentType());
  if (!encoder) {
    log::warn("No encoder available for '{}', response left uncompressed", encoding.str());
    return false;
  }

  // Allocations first: the original body only moves once nothing can throw anymore.
  auto compressed = std::make_unique<CompressedBody>(nullptr, std::move(encoder), encoding, _mode, _encoderChunkSize);
  response.header(http::ContentEncoding, encoding.str());
  response.eraseHeader(http::ContentLength);

  compressed->setSource(response.takeBody());
  response.body(std::move(compressed));
  return true;
}

}  // namespace zipline
