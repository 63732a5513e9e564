#pragma once

#include <cstdint>
#include <string_view>

namespace zipline::http {

// NOTE ON CASE SENSITIVITY
// ------------------------
// HTTP header field names are case-insensitive per RFC 7230. We store them here
// in their conventional canonical form for emission. Lookups in HttpHeaders are
// case-insensitive. Content-coding tokens below are matched case-sensitively by the
// compression negotiation, as presented by the client.

using StatusCode = std::uint16_t;

inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeNoContent = 204;
inline constexpr StatusCode StatusCodeNotFound = 404;

// Methods
inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view POST = "POST";

// Headers
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view AcceptEncoding = "Accept-Encoding";

inline constexpr std::string_view HeaderSep = ": ";

// Content-coding and transfer-coding tokens (RFC 9110 section 8.4.1, RFC 9112 section 7)
inline constexpr std::string_view chunked = "chunked";
inline constexpr std::string_view br = "br";  // RFC 7932 (Brotli)
inline constexpr std::string_view gzip = "gzip";
inline constexpr std::string_view deflate = "deflate";
inline constexpr std::string_view compress = "compress";
inline constexpr std::string_view identity = "identity";
inline constexpr std::string_view trailers = "trailers";

// Content type
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";

}  // namespace zipline::http
