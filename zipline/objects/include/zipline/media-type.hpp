#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace zipline {

// A media type reduced to its (top, subtype) pair, e.g. "text/html" or "image/*".
// Parameters ("; charset=utf-8") are accepted by the parsers but dropped: two media types compare equal iff
// both components are equal, ignoring ASCII case.
// Immutable once constructed.
class MediaType {
 public:
  static constexpr std::string_view kWildcard = "*";

  // Constructs a MediaType from already validated components.
  // Throws std::invalid_argument if any component is empty or contains a non-token character.
  MediaType(std::string_view top, std::string_view sub);

  // Strict parsing of "top/sub[;params]", with optional surrounding whitespace.
  // Returns std::nullopt if the input is not a valid media type.
  [[nodiscard]] static std::optional<MediaType> Parse(std::string_view str);

  // Same as Parse, but additionally accepts a bare extension shorthand without '/'
  // (e.g. "json" -> application/json, "wasm" -> application/wasm).
  [[nodiscard]] static std::optional<MediaType> ParseFlexible(std::string_view str);

  [[nodiscard]] std::string_view top() const noexcept { return {_data.data(), _slashPos}; }

  [[nodiscard]] std::string_view sub() const noexcept {
    return std::string_view(_data).substr(static_cast<std::size_t>(_slashPos) + 1U);
  }

  [[nodiscard]] bool isWildcardSub() const noexcept { return sub() == kWildcard; }

  // "top/sub"
  [[nodiscard]] std::string_view str() const noexcept { return _data; }

  bool operator==(const MediaType &rhs) const noexcept;

 private:
  MediaType() noexcept = default;

  std::string _data;
  uint32_t _slashPos{};
};

// Tells whether 'candidate' falls under 'exclusion'.
// A wildcard subtype on the exclusion side matches any subtype of the same top type,
// otherwise both components must be equal. Wildcards on the candidate side have no special meaning.
[[nodiscard]] bool Matches(const MediaType &candidate, const MediaType &exclusion) noexcept;

// Returns false when no content type is known (compression may proceed), otherwise true iff any of the
// exclusions matches.
[[nodiscard]] bool IsExcluded(const std::optional<MediaType> &contentType,
                              std::span<const MediaType> exclusions) noexcept;

}  // namespace zipline
