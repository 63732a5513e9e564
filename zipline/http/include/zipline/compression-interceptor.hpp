#pragma once

#include <string_view>

#include "zipline/compression-negotiation.hpp"
#include "zipline/http-request.hpp"
#include "zipline/http-response.hpp"
#include "zipline/response-compressor.hpp"
#include "zipline/response-interceptor.hpp"
#include "zipline/server-config.hpp"

namespace zipline {

// Compresses all eligible responses with Brotli or gzip.
//
// By default, responses with a Content-Type matching any of the following are not compressed:
//   application/gzip, application/zip, image/*, video/*, application/wasm, application/octet-stream
// Setting CompressionConfig::excludedContentTypes replaces this list entirely: defaults must be added back
// one by one if desired.
//
// Note: compressing responses of an HTTPS site may expose it to attacks such as BREACH. Evaluate the risk for
// your application before attaching this interceptor.
class CompressionInterceptor final : public ResponseInterceptor {
 public:
  static constexpr std::string_view kName = "Response compression";

  // Ready to use with the default configuration, even before onStartup().
  CompressionInterceptor() = default;

  [[nodiscard]] std::string_view name() const noexcept override { return kName; }

  // Rebuilds the negotiation rules from 'config.compression'.
  // Throws std::invalid_argument (after logging it) on invalid configuration, keeping the previous rules.
  void onStartup(const ServerConfig &config) override;

  void onResponse(const HttpRequest &request, HttpResponse &response) override;

  [[nodiscard]] const CompressionNegotiator &negotiator() const noexcept { return _negotiator; }

 private:
  CompressionNegotiator _negotiator;
  ResponseCompressor _compressor;
};

}  // namespace zipline
