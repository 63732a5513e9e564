#include "zipline/media-type.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>

#include "zipline/mime-mappings.hpp"
#include "zipline/string-equal-ignore-case.hpp"
#include "zipline/string-trim.hpp"
#include "zipline/tchars.hpp"

namespace zipline {

namespace {

constexpr bool IsToken(std::string_view str) noexcept {
  return !str.empty() && std::ranges::all_of(str, [](char ch) { return is_tchar(ch); });
}

}  // namespace

MediaType::MediaType(std::string_view top, std::string_view sub) : _slashPos(static_cast<uint32_t>(top.size())) {
  if (!IsToken(top) || !IsToken(sub)) {
    throw std::invalid_argument("Invalid media type component");
  }
  _data.reserve(top.size() + 1U + sub.size());
  _data.append(top);
  _data.push_back('/');
  _data.append(sub);
}

std::optional<MediaType> MediaType::Parse(std::string_view str) {
  str = TrimOws(str);
  const auto semiColonPos = str.find(';');
  if (semiColonPos != std::string_view::npos) {
    str = TrimOws(str.substr(0, semiColonPos));
  }
  const auto slashPos = str.find('/');
  if (slashPos == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view top = str.substr(0, slashPos);
  const std::string_view sub = str.substr(slashPos + 1U);
  if (!IsToken(top) || !IsToken(sub)) {
    return std::nullopt;
  }
  MediaType ret;
  ret._data.assign(str);
  ret._slashPos = static_cast<uint32_t>(slashPos);
  return ret;
}

std::optional<MediaType> MediaType::ParseFlexible(std::string_view str) {
  const std::string_view trimmed = TrimOws(str);
  if (trimmed.find('/') == std::string_view::npos) {
    const std::string_view mimeType = MIMETypeForExtension(trimmed);
    if (mimeType.empty()) {
      return std::nullopt;
    }
    return Parse(mimeType);
  }
  return Parse(trimmed);
}

bool MediaType::operator==(const MediaType &rhs) const noexcept {
  return CaseInsensitiveEqual(top(), rhs.top()) && CaseInsensitiveEqual(sub(), rhs.sub());
}

bool Matches(const MediaType &candidate, const MediaType &exclusion) noexcept {
  if (exclusion.isWildcardSub()) {
    return CaseInsensitiveEqual(exclusion.top(), candidate.top());
  }
  return exclusion == candidate;
}

bool IsExcluded(const std::optional<MediaType> &contentType, std::span<const MediaType> exclusions) noexcept {
  if (!contentType) {
    return false;
  }
  return std::ranges::any_of(exclusions,
                             [&contentType](const MediaType &exclusion) { return Matches(*contentType, exclusion); });
}

}  // namespace zipline
