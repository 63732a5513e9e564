#include "zipline/encoding.hpp"

#include <string_view>
#include <type_traits>

namespace zipline {

Encoding Encoding::Parse(std::string_view token) {
  for (std::underlying_type_t<Type> pos = 0; pos < kNbStandardEncodings; ++pos) {
    const auto type = static_cast<Type>(pos);
    if (GetEncodingStr(type) == token) {
      return type;
    }
  }
  return Extension(token);
}

std::string_view Encoding::str() const noexcept {
  if (_type == Type::ext) {
    return _ext;
  }
  return GetEncodingStr(_type);
}

}  // namespace zipline
