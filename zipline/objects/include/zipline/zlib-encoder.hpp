#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include "zipline/compression-config.hpp"
#include "zipline/encoder.hpp"
#include "zipline/raw-chars.hpp"
#include "zipline/zlib-stream-raii.hpp"

namespace zipline {

class ZlibEncoderContext : public EncoderContext {
 public:
  ZlibEncoderContext(ZStreamRAII::Variant variant, RawChars& sharedBuf, int8_t level);

  std::string_view encodeChunk(std::size_t encoderChunkSize, std::string_view chunk) override;

 private:
  RawChars& _buf;
  ZStreamRAII _zs;
};

class ZlibEncoder : public Encoder {
 public:
  explicit ZlibEncoder(ZStreamRAII::Variant variant, int8_t level = CompressionConfig::Zlib::kLevel,
                       std::size_t initialCapacity = 4096UL)
      : _buf(initialCapacity), _level(level), _variant(variant) {}

  void encodeFull(std::string_view data, RawChars& buf) override;

  std::unique_ptr<EncoderContext> makeContext() override {
    return std::make_unique<ZlibEncoderContext>(_variant, _buf, _level);
  }

 private:
  RawChars _buf;  // shared output buffer of streaming contexts (single-thread guarantee)
  int8_t _level;
  ZStreamRAII::Variant _variant;
};

}  // namespace zipline
