#include "zipline/http-response.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "zipline/body-producer.hpp"
#include "zipline/http-constants.hpp"
#include "zipline/media-type.hpp"

namespace zipline {

HttpResponse::HttpResponse(std::string body, std::string_view contentType) : _status(http::StatusCodeOK) {
  _headers.set(http::ContentType, contentType);
  this->body(std::move(body));
}

std::optional<MediaType> HttpResponse::contentType() const {
  const auto value = headerValue(http::ContentType);
  if (!value) {
    return std::nullopt;
  }
  return MediaType::Parse(*value);
}

HttpResponse &HttpResponse::body(std::string data) & {
  _body = std::make_unique<InMemoryBody>(std::move(data));
  return *this;
}

}  // namespace zipline
