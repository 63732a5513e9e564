#include <zipline/zipline.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

using namespace zipline;

// Runs a few responses through a compression interceptor, as a host server would after each handler.
// Usage: zipline-compression-example [accept-encoding] [excluded-type...]
int main(int argc, char **argv) {
  const std::string_view acceptEncoding = argc > 1 ? argv[1] : "gzip, br";

  CompressionConfig compressionConfig;
  if (argc > 2) {
    compressionConfig.excludedContentTypes.assign(argv + 2, argv + argc);
  }
  compressionConfig.withBrotli(brotliEnabled());

  InterceptorChain chain;
  try {
    chain.attach(std::make_unique<CompressionInterceptor>());
    chain.start(ServerConfig{}.withCompression(std::move(compressionConfig)));
  } catch (const std::exception &e) {
    std::cerr << "Invalid configuration: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  HttpRequest request(http::GET, "/");
  request.addHeader(http::AcceptEncoding, acceptEncoding);

  std::string page;
  for (int line = 0; line < 200; ++line) {
    page.append("<p>Hello from zipline, line ").append(std::to_string(line)).append("</p>\n");
  }

  HttpResponse responses[] = {
      HttpResponse(page, http::ContentTypeTextHtml),
      HttpResponse(std::string(4096, '\x7f'), "image/png"),
      HttpResponse(R"({"compressed":false})", http::ContentTypeApplicationJson).header(http::ContentEncoding,
                                                                                          http::identity),
  };

  for (auto &response : responses) {
    const std::string contentType(response.headerValueOrEmpty(http::ContentType));
    chain.onResponse(request, response);

    auto body = response.takeBody();
    const auto result = ReadAll(*body);
    if (!result.ok()) {
      std::cerr << contentType << ": body error: " << *result.error << '\n';
      return EXIT_FAILURE;
    }
    const std::string_view encoding = response.headerValueOrEmpty(http::ContentEncoding);
    std::cout << contentType << " -> Content-Encoding: " << (encoding.empty() ? "(none)" : encoding) << ", "
              << result.data.size() << " bytes\n";
  }

  return EXIT_SUCCESS;
}
