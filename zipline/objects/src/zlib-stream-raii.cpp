#include "zipline/zlib-stream-raii.hpp"

#include <zconf.h>
#include <zlib.h>

#include <cstdint>
#include <format>
#include <stdexcept>

#include "zipline/log.hpp"

namespace zipline {

namespace {
constexpr int ComputeWindowBits(ZStreamRAII::Variant variant) {
  switch (variant) {
    case ZStreamRAII::Variant::gzip:
      return MAX_WBITS + 16;
    case ZStreamRAII::Variant::deflate:
      return MAX_WBITS;
    default:
      throw std::invalid_argument("Invalid zlib variant");
  }
}
}  // namespace

ZStreamRAII::ZStreamRAII(Variant variant, int8_t level) {
  const auto ret = deflateInit2(&stream, level, Z_DEFLATED, ComputeWindowBits(variant), 8, Z_DEFAULT_STRATEGY);
  if (ret != Z_OK) {
    throw std::runtime_error(std::format("Error from deflateInit2 - error {}", ret));
  }
}

ZStreamRAII::~ZStreamRAII() {
  const auto ret = deflateEnd(&stream);
  // Z_DATA_ERROR is returned when the stream is freed before Z_FINISH, which happens for abandoned bodies.
  if (ret != Z_OK && ret != Z_DATA_ERROR) {
    log::error("zlib: deflateEnd returned {} (ignored)", ret);
  }
}

}  // namespace zipline
