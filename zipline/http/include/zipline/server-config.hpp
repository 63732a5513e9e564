#pragma once

#include "zipline/compression-config.hpp"

namespace zipline {

// Configuration handed to interceptors at startup.
struct ServerConfig {
  // Throws std::invalid_argument if the configuration is invalid.
  void validate() const { compression.validate(); }

  ServerConfig &withCompression(CompressionConfig compressionConfig);

  CompressionConfig compression;
};

}  // namespace zipline
