#include "zipline/brotli-encoder.hpp"

#include <brotli/encode.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "zipline/compression-config.hpp"
#include "zipline/compression-test-helpers.hpp"
#include "zipline/media-type.hpp"
#include "zipline/raw-chars.hpp"

namespace zipline {

namespace {

constexpr std::size_t kEncoderChunkSize = 512;

std::vector<std::string> samplePayloads() {
  std::vector<std::string> payloads;
  payloads.emplace_back("");
  payloads.emplace_back("Hello, Brotli compression!");
  payloads.emplace_back(512, 'A');
  payloads.emplace_back(test::MakePatternedPayload(128UL * 1024UL));
  return payloads;
}

std::string BuildStreamingCompressed(BrotliEncoder& encoder, std::string_view payload, std::size_t split) {
  std::string compressed;
  auto ctx = encoder.makeContext();
  std::string_view remaining = payload;
  while (!remaining.empty()) {
    const std::size_t take = std::min(split, remaining.size());
    compressed.append(ctx->encodeChunk(kEncoderChunkSize, remaining.substr(0, take)));
    remaining.remove_prefix(take);
  }
  compressed.append(ctx->encodeChunk(kEncoderChunkSize, {}));
  return compressed;
}

}  // namespace

TEST(BrotliModeTest, ModeFollowsContentCategory) {
  EXPECT_EQ(BrotliModeFor(MediaType::Parse("text/html")), BROTLI_MODE_TEXT);
  EXPECT_EQ(BrotliModeFor(MediaType::Parse("TEXT/css; charset=utf-8")), BROTLI_MODE_TEXT);
  EXPECT_EQ(BrotliModeFor(MediaType::Parse("font/woff2")), BROTLI_MODE_FONT);
  EXPECT_EQ(BrotliModeFor(MediaType::Parse("application/json")), BROTLI_MODE_GENERIC);
  EXPECT_EQ(BrotliModeFor(std::nullopt), BROTLI_MODE_GENERIC);
}

TEST(BrotliEncoderTest, EncodeFullRoundTrip) {
  for (auto mode : {BROTLI_MODE_GENERIC, BROTLI_MODE_TEXT, BROTLI_MODE_FONT}) {
    BrotliEncoder encoder(mode);
    for (const auto& payload : samplePayloads()) {
      RawChars compressed;
      encoder.encodeFull(payload, compressed);
      EXPECT_FALSE(compressed.empty());
      EXPECT_EQ(test::BrotliDecompress(compressed), payload);
    }
  }
}

TEST(BrotliEncoderTest, EncodeFullAppendsToBuffer) {
  BrotliEncoder encoder;
  RawChars buf;
  buf.append("head");
  encoder.encodeFull("brotli body", buf);

  const std::string_view all(buf);
  EXPECT_EQ(all.substr(0, 4), "head");
  EXPECT_EQ(test::BrotliDecompress(all.substr(4)), "brotli body");
}

TEST(BrotliEncoderTest, StreamingRoundTripVariousSplits) {
  BrotliEncoder encoder(BROTLI_MODE_TEXT, CompressionConfig::Brotli::kQuality);
  for (const auto& payload : samplePayloads()) {
    for (std::size_t split : {3UL, 4096UL, 100000UL}) {
      if (payload.size() > 4096 && split == 3) {
        continue;
      }
      EXPECT_EQ(test::BrotliDecompress(BuildStreamingCompressed(encoder, payload, split)), payload)
          << "split " << split;
    }
  }
}

TEST(BrotliEncoderTest, SmallChunkSizeStillProducesCompleteStream) {
  BrotliEncoder encoder;
  const std::string payload = test::MakePatternedPayload(50000);
  auto ctx = encoder.makeContext();
  std::string compressed(ctx->encodeChunk(1, payload));
  compressed.append(ctx->encodeChunk(1, {}));
  EXPECT_EQ(test::BrotliDecompress(compressed), payload);
}

}  // namespace zipline
