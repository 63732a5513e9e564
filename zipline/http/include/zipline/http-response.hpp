#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "zipline/body-producer.hpp"
#include "zipline/http-constants.hpp"
#include "zipline/http-header.hpp"
#include "zipline/media-type.hpp"

namespace zipline {

// -----------------------------------------------------------------------------
// HttpResponse
// -----------------------------------------------------------------------------
// Outgoing response as seen by interceptors: a status code, an ordered header list
// and a single body slot.
//
// Body ownership:
//   The body slot holds a lazy BodyProducer, owned by the response. takeBody()
//   moves it out and leaves the slot empty, so a body can only be consumed once.
//   Installing a new body through body() replaces (and destroys) any previous one.
//
// Safety & Assumptions:
//   - Not thread-safe. A response is handled by one thread at a time.
//   - header() / addHeader() throw std::invalid_argument on invalid names or values.
// -----------------------------------------------------------------------------
class HttpResponse {
 public:
  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK) noexcept : _status(code) {}

  // Constructs a 200 response with an in-memory body and a Content-Type header.
  explicit HttpResponse(std::string body, std::string_view contentType = http::ContentTypeTextPlain);

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  HttpResponse &status(http::StatusCode statusCode) & noexcept {
    _status = statusCode;
    return *this;
  }

  HttpResponse &&status(http::StatusCode statusCode) && noexcept {
    _status = statusCode;
    return std::move(*this);
  }

  [[nodiscard]] const HttpHeaders &headers() const noexcept { return _headers; }

  // Retrieves the value of the first occurrence of the given header key (case-insensitive search per RFC 7230).
  // If the header is not found, returns std::nullopt.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept {
    return _headers.value(key);
  }

  // Like headerValue() but returns an empty view for a missing header.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept {
    const auto optValue = headerValue(key);
    return optValue ? *optValue : std::string_view{};
  }

  // Sets a header, replacing any existing one with the same name.
  HttpResponse &header(std::string_view key, std::string_view value) & {
    _headers.set(key, value);
    return *this;
  }

  HttpResponse &&header(std::string_view key, std::string_view value) && {
    _headers.set(key, value);
    return std::move(*this);
  }

  // Appends a header, keeping any existing one with the same name.
  HttpResponse &addHeader(std::string_view key, std::string_view value) & {
    _headers.add(key, value);
    return *this;
  }

  HttpResponse &&addHeader(std::string_view key, std::string_view value) && {
    _headers.add(key, value);
    return std::move(*this);
  }

  // Removes all headers with this name. Returns the number of removed headers.
  std::size_t eraseHeader(std::string_view key) { return _headers.erase(key); }

  // Parsed Content-Type header. std::nullopt if absent or not a valid media type.
  [[nodiscard]] std::optional<MediaType> contentType() const;

  // Installs an in-memory body.
  HttpResponse &body(std::string data) &;

  HttpResponse &&body(std::string data) && {
    body(std::move(data));
    return std::move(*this);
  }

  // Installs any body producer (an empty pointer clears the body).
  HttpResponse &body(std::unique_ptr<BodyProducer> producer) & noexcept {
    _body = std::move(producer);
    return *this;
  }

  HttpResponse &&body(std::unique_ptr<BodyProducer> producer) && noexcept {
    _body = std::move(producer);
    return std::move(*this);
  }

  [[nodiscard]] bool hasBody() const noexcept { return _body != nullptr; }

  // Moves the body out of the response, leaving it without body. Returns nullptr if there is none.
  [[nodiscard]] std::unique_ptr<BodyProducer> takeBody() noexcept { return std::move(_body); }

 private:
  HttpHeaders _headers;
  std::unique_ptr<BodyProducer> _body;
  http::StatusCode _status;
};

}  // namespace zipline
