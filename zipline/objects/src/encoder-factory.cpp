#include "zipline/encoder-factory.hpp"

#include <memory>
#include <optional>

#include "zipline/encoder.hpp"
#include "zipline/encoding.hpp"
#include "zipline/media-type.hpp"

#ifdef ZIPLINE_ENABLE_ZLIB
#include "zipline/zlib-encoder.hpp"
#include "zipline/zlib-stream-raii.hpp"
#endif

#ifdef ZIPLINE_ENABLE_BROTLI
#include "zipline/brotli-encoder.hpp"
#endif

namespace zipline {

std::unique_ptr<Encoder> MakeEncoder(const Encoding &encoding,
                                     [[maybe_unused]] const std::optional<MediaType> &contentType) {
  switch (encoding.type()) {
#ifdef ZIPLINE_ENABLE_ZLIB
    case Encoding::Type::gzip:
      return std::make_unique<ZlibEncoder>(ZStreamRAII::Variant::gzip);
    case Encoding::Type::deflate:
      return std::make_unique<ZlibEncoder>(ZStreamRAII::Variant::deflate);
#endif
#ifdef ZIPLINE_ENABLE_BROTLI
    case Encoding::Type::br:
      return std::make_unique<BrotliEncoder>(BrotliModeFor(contentType));
#endif
    default:
      return nullptr;
  }
}

}  // namespace zipline
