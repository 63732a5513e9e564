#include "zipline/mime-mappings.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string_view>

#include "zipline/toupperlower.hpp"

namespace zipline {

static_assert(std::ranges::is_sorted(kMIMEMappings, {}, &MIMEMapping::extension),
              "kMIMEMappings must be sorted by extension");

std::string_view MIMETypeForExtension(std::string_view extension) {
  static constexpr std::size_t kMaximumKnownExtensionSize =
      std::ranges::max_element(kMIMEMappings, [](const auto &lhs, const auto &rhs) {
        return lhs.extension.size() < rhs.extension.size();
      })->extension.size();

  if (extension.empty() || extension.size() > kMaximumKnownExtensionSize) {
    return {};
  }

  char extBuf[kMaximumKnownExtensionSize];
  const auto endIt = std::ranges::transform(extension, extBuf, [](char ch) { return tolower(ch); }).out;

  const std::string_view ext(extBuf, endIt);
  const auto it = std::ranges::lower_bound(kMIMEMappings, ext, {}, &MIMEMapping::extension);
  if (it != std::end(kMIMEMappings) && it->extension == ext) {
    return it->mimeType;
  }
  return {};
}

}  // namespace zipline
