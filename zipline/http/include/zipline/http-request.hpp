#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "zipline/http-constants.hpp"
#include "zipline/http-header.hpp"

namespace zipline {

// Request view handed by the host server to interceptors and handlers.
class HttpRequest {
 public:
  HttpRequest() = default;

  HttpRequest(std::string_view method, std::string_view path) : _method(method), _path(path) {}

  [[nodiscard]] std::string_view method() const noexcept { return _method; }

  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  [[nodiscard]] const HttpHeaders &headers() const noexcept { return _headers; }

  // Retrieves the value of the first occurrence of the given header key (case-insensitive search per RFC 7230).
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept {
    return _headers.value(key);
  }

  // Appends a header (duplicates are kept, as several Accept-Encoding lines may be sent).
  HttpRequest &addHeader(std::string_view key, std::string_view value) & {
    _headers.add(key, value);
    return *this;
  }

  HttpRequest &&addHeader(std::string_view key, std::string_view value) && {
    _headers.add(key, value);
    return std::move(*this);
  }

 private:
  std::string _method{http::GET};
  std::string _path{"/"};
  HttpHeaders _headers;
};

}  // namespace zipline
