#include "zipline/http-header.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "zipline/http-constants.hpp"
#include "zipline/string-equal-ignore-case.hpp"
#include "zipline/string-trim.hpp"
#include "zipline/tchars.hpp"

namespace zipline::http {

Header::Header(std::string_view name, std::string_view value) : _colonPos(static_cast<uint32_t>(name.size())) {
  value = TrimOws(value);
  if (!IsValidHeaderName(name)) {
    throw std::invalid_argument("HTTP header name is invalid");
  }
  if (!IsValidHeaderValue(value)) {
    throw std::invalid_argument("HTTP header value is invalid");
  }
  _data.reserve(name.size() + HeaderSep.size() + value.size());
  _data.append(name);
  _data.append(HeaderSep);
  _data.append(value);
}

bool IsValidHeaderName(std::string_view name) noexcept {
  return !name.empty() && std::ranges::all_of(name, [](char ch) { return is_tchar(ch); });
}

bool IsValidHeaderValue(std::string_view value) noexcept {
  return std::ranges::all_of(value, [](unsigned char ch) {
    if (ch == '\r' || ch == '\n') {
      return false;
    }
    if (ch == '\t') {
      return true;
    }
    // Visible ASCII characters
    return ch >= 0x20 && ch <= 0x7E;
  });
}

}  // namespace zipline::http

namespace zipline {

HttpHeaders &HttpHeaders::add(std::string_view name, std::string_view value) {
  _headers.emplace_back(name, value);
  return *this;
}

HttpHeaders &HttpHeaders::set(std::string_view name, std::string_view value) {
  http::Header header(name, value);
  auto it = std::ranges::find_if(_headers, [name](const http::Header &existing) {
    return CaseInsensitiveEqual(existing.name(), name);
  });
  if (it == _headers.end()) {
    _headers.push_back(std::move(header));
    return *this;
  }
  *it = std::move(header);
  const std::string_view newName = it->name();
  _headers.erase(std::remove_if(std::next(it), _headers.end(),
                                [newName](const http::Header &existing) {
                                  return CaseInsensitiveEqual(existing.name(), newName);
                                }),
                 _headers.end());
  return *this;
}

std::size_t HttpHeaders::erase(std::string_view name) {
  return std::erase_if(_headers,
                       [name](const http::Header &header) { return CaseInsensitiveEqual(header.name(), name); });
}

std::optional<std::string_view> HttpHeaders::value(std::string_view name) const noexcept {
  auto it = std::ranges::find_if(_headers,
                                 [name](const http::Header &header) { return CaseInsensitiveEqual(header.name(), name); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return it->value();
}

}  // namespace zipline
