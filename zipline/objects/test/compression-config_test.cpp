#include "zipline/compression-config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "zipline/features.hpp"
#include "zipline/media-type.hpp"

namespace zipline {

TEST(CompressionConfigTest, DefaultIsValid) {
  CompressionConfig config;

  EXPECT_NO_THROW(config.validate());
}

TEST(CompressionConfigTest, Defaults) {
  CompressionConfig config;

  EXPECT_EQ(config.enableGzip, zlibEnabled());
  EXPECT_FALSE(config.enableBrotli);
  EXPECT_EQ(config.mode, BodyCompressionMode::buffered);
  EXPECT_EQ(config.encoderChunkSize, 64UL * 1024UL);
  EXPECT_EQ(config.excludedContentTypes,
            (std::vector<std::string>{"application/gzip", "application/zip", "image/*", "video/*", "application/wasm",
                                      "application/octet-stream"}));
}

TEST(CompressionConfigTest, ZeroEncoderChunkSizeThrows) {
  CompressionConfig config;
  config.encoderChunkSize = 0;

  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(CompressionConfigTest, ParseDefaultExclusions) {
  const auto exclusions = CompressionConfig{}.parseExclusions();

  ASSERT_EQ(exclusions.size(), 6U);
  EXPECT_EQ(exclusions[0].str(), "application/gzip");
  EXPECT_EQ(exclusions[2].str(), "image/*");
  EXPECT_TRUE(exclusions[2].isWildcardSub());
  EXPECT_EQ(exclusions[5].str(), "application/octet-stream");
}

TEST(CompressionConfigTest, CustomExclusionsReplaceDefaults) {
  CompressionConfig config;
  config.withExcludedContentTypes({"application/json", "text/*"});

  const auto exclusions = config.parseExclusions();
  ASSERT_EQ(exclusions.size(), 2U);
  EXPECT_EQ(exclusions[0].str(), "application/json");
  EXPECT_EQ(exclusions[1].str(), "text/*");
  EXPECT_FALSE(IsExcluded(MediaType::Parse("image/png"), exclusions));
}

TEST(CompressionConfigTest, EmptyExclusionsAreValid) {
  CompressionConfig config;
  config.withExcludedContentTypes({});

  EXPECT_NO_THROW(config.validate());
  EXPECT_TRUE(config.parseExclusions().empty());
}

TEST(CompressionConfigTest, ExtensionShorthandExclusions) {
  CompressionConfig config;
  config.withExcludedContentTypes({"json", "wasm", "image/*"});

  const auto exclusions = config.parseExclusions();
  ASSERT_EQ(exclusions.size(), 3U);
  EXPECT_EQ(exclusions[0].str(), "application/json");
  EXPECT_EQ(exclusions[1].str(), "application/wasm");
}

TEST(CompressionConfigTest, MalformedExclusionThrows) {
  for (auto pattern : {"not a media type", "text/", "/html", "unknownext", ""}) {
    CompressionConfig config;
    config.withExcludedContentTypes({"image/*", pattern});

    EXPECT_THROW(config.validate(), std::invalid_argument) << pattern;
    EXPECT_THROW((void)config.parseExclusions(), std::invalid_argument) << pattern;
  }
}

TEST(CompressionConfigTest, ValidateCodecsIgnoresExclusions) {
  CompressionConfig config;
  config.withExcludedContentTypes({"not a media type"});

  EXPECT_NO_THROW(config.validateCodecs());
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config.encoderChunkSize = 0;
  EXPECT_THROW(config.validateCodecs(), std::invalid_argument);
}

TEST(CompressionConfigTest, MalformedExclusionMessageNamesPattern) {
  CompressionConfig config;
  config.withExcludedContentTypes({"text/ht ml"});
  try {
    config.validate();
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument& ex) {
    EXPECT_NE(std::string(ex.what()).find("text/ht ml"), std::string::npos);
  }
}

TEST(CompressionConfigTest, Builders) {
  CompressionConfig config;
  config.withGzip(false).withBrotli(brotliEnabled()).withMode(BodyCompressionMode::streaming);

  EXPECT_FALSE(config.enableGzip);
  EXPECT_EQ(config.enableBrotli, brotliEnabled());
  EXPECT_EQ(config.mode, BodyCompressionMode::streaming);
  EXPECT_NO_THROW(config.validate());
}

#ifndef ZIPLINE_ENABLE_ZLIB
TEST(CompressionConfigTest, GzipWithoutZlibThrows) {
  CompressionConfig config;
  config.enableGzip = true;

  EXPECT_THROW(config.validate(), std::invalid_argument);
}
#endif

#ifndef ZIPLINE_ENABLE_BROTLI
TEST(CompressionConfigTest, BrotliWithoutBrotliThrows) {
  CompressionConfig config;
  config.enableBrotli = true;

  EXPECT_THROW(config.validate(), std::invalid_argument);
}
#endif

#ifdef ZIPLINE_ENABLE_BROTLI
TEST(CompressionConfigTest, BrotliPreset) {
  static_assert(CompressionConfig::Brotli::kQuality == 2);
  CompressionConfig config;
  config.withBrotli();

  EXPECT_NO_THROW(config.validate());
}
#endif

}  // namespace zipline
