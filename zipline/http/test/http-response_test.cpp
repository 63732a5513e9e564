#include "zipline/http-response.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "zipline/body-producer.hpp"
#include "zipline/http-constants.hpp"
#include "zipline/http-request.hpp"

namespace zipline {

TEST(HttpResponseTest, DefaultHasNoBody) {
  HttpResponse response;
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_FALSE(response.hasBody());
  EXPECT_EQ(response.takeBody(), nullptr);
  EXPECT_FALSE(response.contentType());
  EXPECT_TRUE(response.headers().empty());
}

TEST(HttpResponseTest, BodyConstructorSetsContentType) {
  HttpResponse response("hello", http::ContentTypeTextHtml);
  EXPECT_EQ(response.headerValue(http::ContentType), "text/html");
  ASSERT_TRUE(response.contentType());
  EXPECT_EQ(response.contentType()->str(), "text/html");
  EXPECT_TRUE(response.hasBody());
}

TEST(HttpResponseTest, ContentTypeParametersAreDropped) {
  HttpResponse response("x", "Text/HTML; charset=utf-8");
  ASSERT_TRUE(response.contentType());
  EXPECT_EQ(response.contentType()->top(), "Text");
  EXPECT_EQ(response.contentType()->sub(), "HTML");
}

TEST(HttpResponseTest, InvalidContentTypeIsAbsent) {
  HttpResponse response("x", "garbage");
  EXPECT_EQ(response.headerValueOrEmpty(http::ContentType), "garbage");
  EXPECT_FALSE(response.contentType());
}

TEST(HttpResponseTest, TakeBodyLeavesSlotEmpty) {
  HttpResponse response("payload");
  auto body = response.takeBody();
  ASSERT_NE(body, nullptr);
  EXPECT_FALSE(response.hasBody());
  EXPECT_EQ(response.takeBody(), nullptr);
  EXPECT_EQ(ReadAll(*body).data, "payload");
}

TEST(HttpResponseTest, BodySettersReplacePreviousBody) {
  HttpResponse response;
  response.body("first");
  response.body(std::make_unique<InMemoryBody>("second"));
  EXPECT_EQ(ReadAll(*response.takeBody()).data, "second");

  response.body(std::unique_ptr<BodyProducer>{});
  EXPECT_FALSE(response.hasBody());
}

TEST(HttpResponseTest, HeaderSetAddErase) {
  HttpResponse response;
  response.header("X-A", "1").addHeader("X-A", "2").header(http::ContentLength, "12");
  EXPECT_EQ(response.headers().size(), 3U);
  response.header("x-a", "3");
  EXPECT_EQ(response.headerValue("X-A"), "3");
  EXPECT_EQ(response.eraseHeader(http::ContentLength), 1U);
  EXPECT_EQ(response.headerValueOrEmpty(http::ContentLength), "");
  EXPECT_THROW(response.header("Bad Name", "v"), std::invalid_argument);
}

TEST(HttpResponseTest, RvalueBuilders) {
  HttpResponse response = HttpResponse(http::StatusCodeNotFound).header(http::ContentType, "text/plain").body("nope");
  EXPECT_EQ(response.status(), http::StatusCodeNotFound);
  EXPECT_EQ(ReadAll(*response.takeBody()).data, "nope");
}

TEST(HttpRequestTest, Defaults) {
  HttpRequest request;
  EXPECT_EQ(request.method(), http::GET);
  EXPECT_EQ(request.path(), "/");
  EXPECT_FALSE(request.headerValue(http::AcceptEncoding));

  HttpRequest other = HttpRequest(http::POST, "/upload").addHeader(http::AcceptEncoding, "gzip");
  EXPECT_EQ(other.method(), "POST");
  EXPECT_EQ(other.headerValue("accept-encoding"), "gzip");
}

}  // namespace zipline
