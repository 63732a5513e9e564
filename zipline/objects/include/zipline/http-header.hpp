#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "zipline/http-constants.hpp"
#include "zipline/string-equal-ignore-case.hpp"

namespace zipline::http {

// Represents a single HTTP header field.
// The name and value are validated upon construction.
class Header {
 public:
  // Constructs a Header with the given name and value.
  // The value is trimmed.
  // Throws std::invalid_argument if the name or the value is invalid.
  Header(std::string_view name, std::string_view value);

  [[nodiscard]] std::string_view name() const noexcept { return {_data.data(), _colonPos}; }

  [[nodiscard]] std::string_view value() const noexcept {
    return std::string_view(_data).substr(_colonPos + HeaderSep.size());
  }

  // Returns the raw header as "Name: Value".
  [[nodiscard]] std::string_view raw() const noexcept { return _data; }

 private:
  std::string _data;
  uint32_t _colonPos;
};

// Validates that a header name consists only of tchar characters as per RFC 7230 §3.2.6.
bool IsValidHeaderName(std::string_view name) noexcept;

// Validates that a header value does not contain CR or LF, only HTAB and visible ASCII characters.
// The empty value is allowed.
bool IsValidHeaderValue(std::string_view value) noexcept;

}  // namespace zipline::http

namespace zipline {

// Ordered list of header fields. Duplicates are allowed, lookups are case-insensitive on the name.
class HttpHeaders {
 public:
  using const_iterator = std::vector<http::Header>::const_iterator;

  // Appends a header, keeping any existing one with the same name.
  HttpHeaders &add(std::string_view name, std::string_view value);

  // Replaces the first header with this name (removing the other ones), or appends it.
  HttpHeaders &set(std::string_view name, std::string_view value);

  // Removes all headers with this name. Returns the number of removed headers.
  std::size_t erase(std::string_view name);

  // Value of the first header with this name, if any.
  [[nodiscard]] std::optional<std::string_view> value(std::string_view name) const noexcept;

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return value(name).has_value(); }

  // Calls 'func' with the value of each header with this name, in order.
  template <class Func>
  void forEachValue(std::string_view name, Func &&func) const {
    for (const auto &header : _headers) {
      if (CaseInsensitiveEqual(header.name(), name)) {
        func(header.value());
      }
    }
  }

  [[nodiscard]] std::size_t size() const noexcept { return _headers.size(); }

  [[nodiscard]] bool empty() const noexcept { return _headers.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _headers.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _headers.end(); }

 private:
  std::vector<http::Header> _headers;
};

}  // namespace zipline
