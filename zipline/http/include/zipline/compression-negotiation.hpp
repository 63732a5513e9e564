#pragma once

#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "zipline/compression-config.hpp"
#include "zipline/encoding.hpp"
#include "zipline/http-request.hpp"
#include "zipline/http-response.hpp"
#include "zipline/media-type.hpp"

namespace zipline {

// Tells whether one of the request's Accept-Encoding headers lists 'token'.
// Each header value is split on commas and each item trimmed, then compared exactly (case-sensitive, parameters
// such as ';q=' are not interpreted).
[[nodiscard]] bool AcceptsEncoding(const HttpRequest &request, std::string_view token);

// Decides whether, and how, a response should be compressed.
// Built once at startup from a validated configuration, then only read: it can be shared by concurrent responses.
class CompressionNegotiator {
 public:
  // Default configuration: gzip only (if built in), default exclusions.
  CompressionNegotiator();

  // Throws std::invalid_argument if 'config' is invalid (malformed exclusion pattern, codec not built in, ...).
  explicit CompressionNegotiator(const CompressionConfig &config);

  // Same as above, but with an explicit exclusion set replacing the configured one: 'config.excludedContentTypes'
  // is neither parsed nor validated.
  CompressionNegotiator(const CompressionConfig &config, std::vector<MediaType> exclusions);

  // Returns the encoding to apply to 'response', or std::nullopt to leave it untouched.
  // Rules, in order:
  //  - a response already carrying Content-Encoding (any value) is never (re)compressed
  //  - a response whose Content-Type matches an exclusion is not compressed (no Content-Type: not excluded)
  //  - br if enabled and accepted, otherwise gzip if enabled and accepted, otherwise nothing.
  [[nodiscard]] std::optional<Encoding> decide(const HttpRequest &request, const HttpResponse &response) const;

  [[nodiscard]] std::span<const MediaType> exclusions() const noexcept { return _exclusions; }

  [[nodiscard]] bool gzipEnabled() const noexcept { return _gzipEnabled; }

  [[nodiscard]] bool brotliEnabled() const noexcept { return _brotliEnabled; }

 private:
  std::vector<MediaType> _exclusions;
  bool _gzipEnabled;
  bool _brotliEnabled;
};

}  // namespace zipline
