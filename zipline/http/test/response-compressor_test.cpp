#include "zipline/response-compressor.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <string_view>

#include "zipline/body-producer.hpp"
#include "zipline/compressed-body.hpp"
#include "zipline/compression-config.hpp"
#include "zipline/compression-test-helpers.hpp"
#include "zipline/encoding.hpp"
#include "zipline/http-constants.hpp"
#include "zipline/http-response.hpp"

namespace zipline {

namespace {

struct ResponseBodyResult {
  BodyReadResult read;
  bool hadBody{false};
};

ResponseBodyResult Drain(HttpResponse& response) {
  ResponseBodyResult result;
  auto body = response.takeBody();
  if (body) {
    result.hadBody = true;
    result.read = ReadAll(*body);
  }
  return result;
}

}  // namespace

TEST(ResponseCompressorTest, NoBodyIsNoop) {
  ResponseCompressor compressor;
  HttpResponse response(http::StatusCodeNoContent);

  EXPECT_FALSE(compressor.apply(response, Encoding::Type::gzip));
  EXPECT_FALSE(response.headerValue(http::ContentEncoding));
  EXPECT_FALSE(response.hasBody());
}

TEST(ResponseCompressorTest, EncodingWithoutEncoderLeavesResponseUntouched) {
  ResponseCompressor compressor;
  for (const Encoding& encoding : {Encoding(Encoding::Type::compress), Encoding(Encoding::Type::chunked),
                                   Encoding(Encoding::Type::identity), Encoding::Extension("x-unknown")}) {
    HttpResponse response("plain body");
    response.header(http::ContentLength, "10");

    EXPECT_FALSE(compressor.apply(response, encoding)) << encoding.str();
    EXPECT_FALSE(response.headerValue(http::ContentEncoding));
    EXPECT_EQ(response.headerValue(http::ContentLength), "10");
    EXPECT_EQ(Drain(response).read.data, "plain body");
  }
}

TEST(ResponseCompressorTest, DefaultMode) {
  EXPECT_EQ(ResponseCompressor{}.mode(), BodyCompressionMode::buffered);
  EXPECT_EQ(ResponseCompressor{CompressionConfig{}.withMode(BodyCompressionMode::streaming)}.mode(),
            BodyCompressionMode::streaming);
}

#ifdef ZIPLINE_ENABLE_ZLIB

TEST(ResponseCompressorTest, ScenarioBGzipReplacesBody) {
  ResponseCompressor compressor;
  HttpResponse response("hello world", http::ContentTypeTextHtml);

  ASSERT_TRUE(compressor.apply(response, Encoding::Type::gzip));
  EXPECT_EQ(response.headerValue(http::ContentEncoding), "gzip");
  EXPECT_EQ(response.headerValue(http::ContentType), "text/html");

  const auto result = Drain(response);
  ASSERT_TRUE(result.hadBody);
  ASSERT_TRUE(result.read.ok());
  EXPECT_TRUE(test::HasGzipMagic(result.read.data));
  EXPECT_EQ(test::ZlibDecompress(result.read.data), "hello world");
}

TEST(ResponseCompressorTest, HeaderMatchesInstalledBody) {
  ResponseCompressor compressor;
  for (const Encoding& encoding : {Encoding(Encoding::Type::gzip), Encoding(Encoding::Type::deflate)}) {
    HttpResponse response("hello world");
    ASSERT_TRUE(compressor.apply(response, encoding));

    auto body = response.takeBody();
    const auto* compressed = dynamic_cast<const CompressedBody*>(body.get());
    ASSERT_NE(compressed, nullptr);
    EXPECT_EQ(compressed->encoding(), encoding);
    EXPECT_EQ(response.headerValue(http::ContentEncoding), encoding.str());
    EXPECT_EQ(test::ZlibDecompress(ReadAll(*body).data, encoding.type() == Encoding::Type::gzip), "hello world");
  }
}

TEST(ResponseCompressorTest, StaleContentLengthIsRemoved) {
  ResponseCompressor compressor;
  HttpResponse response("hello world");
  response.header(http::ContentLength, "11");

  ASSERT_TRUE(compressor.apply(response, Encoding::Type::gzip));
  EXPECT_FALSE(response.headerValue(http::ContentLength));
}

TEST(ResponseCompressorTest, DeflateIsSupported) {
  ResponseCompressor compressor;
  HttpResponse response("deflate me please, deflate me please");

  ASSERT_TRUE(compressor.apply(response, Encoding::Type::deflate));
  EXPECT_EQ(response.headerValue(http::ContentEncoding), "deflate");
  EXPECT_EQ(test::ZlibDecompress(Drain(response).read.data, false), "deflate me please, deflate me please");
}

TEST(ResponseCompressorTest, StreamingModeDecodesMultiChunkBody) {
  ResponseCompressor compressor(CompressionConfig{}.withMode(BodyCompressionMode::streaming));
  const std::string payload = test::MakePatternedPayload(300000);
  HttpResponse response;
  response.body(std::make_unique<InMemoryBody>(payload, 8192));

  ASSERT_TRUE(compressor.apply(response, Encoding::Type::gzip));
  const auto result = Drain(response);
  ASSERT_TRUE(result.read.ok());
  EXPECT_EQ(test::ZlibDecompress(result.read.data), payload);
}

TEST(ResponseCompressorTest, BodyIsNotReadBeforeConsumption) {
  ResponseCompressor compressor;
  int pulls = 0;
  HttpResponse response;
  response.body(std::make_unique<CallbackBody>([&pulls]() {
    ++pulls;
    return pulls == 1 ? BodyChunk::Data("lazy") : BodyChunk::End();
  }));

  ASSERT_TRUE(compressor.apply(response, Encoding::Type::gzip));
  EXPECT_EQ(pulls, 0);
  EXPECT_EQ(test::ZlibDecompress(Drain(response).read.data), "lazy");
  EXPECT_EQ(pulls, 2);
}

TEST(ResponseCompressorTest, SourceFailureIsReportedLazily) {
  for (auto mode : {BodyCompressionMode::buffered, BodyCompressionMode::streaming}) {
    ResponseCompressor compressor(CompressionConfig{}.withMode(mode));
    HttpResponse response;
    response.body(std::make_unique<CallbackBody>([]() { return BodyChunk::Failure("disk unplugged"); }));

    ASSERT_TRUE(compressor.apply(response, Encoding::Type::gzip));
    auto body = response.takeBody();
    ASSERT_TRUE(body);

    const auto first = body->next();
    ASSERT_TRUE(first.isFailure());
    EXPECT_NE(first.error().find("disk unplugged"), std::string_view::npos);
    EXPECT_TRUE(body->next().isEnd());
  }
}

#endif

#ifdef ZIPLINE_ENABLE_BROTLI

TEST(ResponseCompressorTest, BrotliReplacesBody) {
  ResponseCompressor compressor;
  HttpResponse response("<html><body>hello brotli</body></html>", http::ContentTypeTextHtml);

  ASSERT_TRUE(compressor.apply(response, Encoding::Type::br));
  EXPECT_EQ(response.headerValue(http::ContentEncoding), "br");
  EXPECT_EQ(test::BrotliDecompress(Drain(response).read.data), "<html><body>hello brotli</body></html>");
}

#endif

}  // namespace zipline
