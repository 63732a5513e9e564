#include "zipline/server-config.hpp"

#include <utility>

#include "zipline/compression-config.hpp"

namespace zipline {

ServerConfig &ServerConfig::withCompression(CompressionConfig compressionConfig) {
  compression = std::move(compressionConfig);
  return *this;
}

}  // namespace zipline
