#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "zipline/http-constants.hpp"

namespace zipline {

// An HTTP coding token: one of the standard forms, or any other token kept verbatim as an extension.
// Parsing never fails: unknown tokens are data, not errors.
class Encoding {
 public:
  // Standard forms first, 'ext' should be last.
  enum class Type : std::uint8_t {
    chunked,
    br,
    gzip,
    deflate,
    compress,
    identity,
    trailers,
    ext,
  };

  static constexpr std::underlying_type_t<Type> kNbStandardEncodings = static_cast<std::underlying_type_t<Type>>(Type::ext);

  // Implicit on purpose, so that standard encodings can be written as 'Encoding::Type::gzip'.
  Encoding(Type type) noexcept : _type(type) {}  // NOLINT(google-explicit-constructor)

  // Builds an extension value carrying 'token' verbatim, whatever its content.
  [[nodiscard]] static Encoding Extension(std::string_view token) {
    Encoding ret(Type::ext);
    ret._ext.assign(token);
    return ret;
  }

  // Case-sensitive exact match against the standard tokens, anything else becomes an extension.
  [[nodiscard]] static Encoding Parse(std::string_view token);

  [[nodiscard]] Type type() const noexcept { return _type; }

  [[nodiscard]] bool isExtension() const noexcept { return _type == Type::ext; }

  // Textual token form, as written in Content-Encoding / Accept-Encoding.
  [[nodiscard]] std::string_view str() const noexcept;

  bool operator==(const Encoding &) const noexcept = default;

 private:
  Type _type;
  std::string _ext;
};

// Token of a standard encoding type. Returns an empty string for Type::ext.
constexpr std::string_view GetEncodingStr(Encoding::Type type) noexcept {
  constexpr std::string_view kEncodingStrs[Encoding::kNbStandardEncodings] = {
      http::chunked, http::br, http::gzip, http::deflate, http::compress, http::identity, http::trailers,
  };
  const auto idx = static_cast<std::underlying_type_t<Encoding::Type>>(type);
  if (idx >= Encoding::kNbStandardEncodings) {
    return {};
  }
  return kEncodingStrs[idx];
}

}  // namespace zipline
