#pragma once

#include <functional>

#include "zipline/compression-config.hpp"
#include "zipline/http-request.hpp"
#include "zipline/http-response.hpp"

namespace zipline {

using RequestHandler = std::function<HttpResponse(const HttpRequest &)>;

// Compresses 'response' the same way CompressionInterceptor does, but without any Content-Type exclusion: used
// when a handler explicitly wants its response compressed. An existing Content-Encoding is still honored.
// Throws std::invalid_argument if 'config' is invalid. Its exclusion list is ignored, and not validated.
void CompressResponse(const HttpRequest &request, HttpResponse &response, const CompressionConfig &config = {});

// Wraps 'handler' so that each of its responses goes through CompressResponse.
// Throws std::invalid_argument if 'config' is invalid (exclusion list excepted).
RequestHandler Compress(RequestHandler handler, const CompressionConfig &config = {});

}  // namespace zipline
