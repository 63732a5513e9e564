// zipline Umbrella Header
//
// Include this single header to pull in the public compression API:
//   - Configuration types (ServerConfig, CompressionConfig, BodyCompressionMode)
//   - Request / Response primitives (HttpRequest, HttpResponse, body producers)
//   - Negotiation (CompressionNegotiator, Encoding, MediaType)
//   - Host seam (ResponseInterceptor, InterceptorChain, CompressionInterceptor, Compress)
//
// Each re-exported header line is annotated with 'IWYU pragma: export' so that users only including
// <zipline/zipline.hpp> satisfy include-cleaner.
//
// Usage Example:
//    #include <zipline/zipline.hpp>
//    using namespace zipline;
//    InterceptorChain chain;
//    chain.attach(std::make_unique<CompressionInterceptor>());
//    chain.start(ServerConfig{});
//    ...
//    chain.onResponse(request, response);  // for each outgoing response
#pragma once

#include "zipline/body-producer.hpp"            // IWYU pragma: export
#include "zipline/compress-responder.hpp"       // IWYU pragma: export
#include "zipline/compression-config.hpp"       // IWYU pragma: export
#include "zipline/compression-interceptor.hpp"  // IWYU pragma: export
#include "zipline/compression-negotiation.hpp"  // IWYU pragma: export
#include "zipline/encoding.hpp"                 // IWYU pragma: export
#include "zipline/features.hpp"                 // IWYU pragma: export
#include "zipline/http-constants.hpp"           // IWYU pragma: export
#include "zipline/http-request.hpp"             // IWYU pragma: export
#include "zipline/http-response.hpp"            // IWYU pragma: export
#include "zipline/media-type.hpp"               // IWYU pragma: export
#include "zipline/response-compressor.hpp"      // IWYU pragma: export
#include "zipline/response-interceptor.hpp"     // IWYU pragma: export
#include "zipline/server-config.hpp"            // IWYU pragma: export
