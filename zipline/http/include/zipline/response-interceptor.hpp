#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

#include "zipline/http-request.hpp"
#include "zipline/http-response.hpp"
#include "zipline/server-config.hpp"

namespace zipline {

// Middleware invoked after the handler produced a response. It can amend headers/body.
using ResponseMiddleware = std::function<void(const HttpRequest &, HttpResponse &)>;

// Extension point of the host server for components that post-process every outgoing response.
class ResponseInterceptor {
 public:
  virtual ~ResponseInterceptor() = default;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  // Called once, when the host starts. Throwing makes the host refuse to start.
  virtual void onStartup(const ServerConfig &config) = 0;

  // Called once per outgoing response, on the thread handling it.
  virtual void onResponse(const HttpRequest &request, HttpResponse &response) = 0;
};

// Adapts an (already started) interceptor to the ResponseMiddleware shape.
ResponseMiddleware MakeResponseMiddleware(std::shared_ptr<ResponseInterceptor> interceptor);

// Host side registry of interceptors: attach them all, start them once, then run them for each response.
class InterceptorChain {
 public:
  // Throws std::logic_error if start() has already been called.
  InterceptorChain &attach(std::unique_ptr<ResponseInterceptor> interceptor);

  // Calls onStartup of each interceptor, in attach order.
  // An exception thrown by an interceptor is logged and propagated: the host should not start, and the chain is
  // marked as failed (the interceptors started before the failing one are not started again).
  // Throws std::logic_error if called twice, or after a failed start.
  void start(const ServerConfig &config);

  // Runs each interceptor on the response, in attach order. An exception thrown by one interceptor is logged and
  // the next ones still run.
  // Throws std::logic_error if the chain is not started.
  void onResponse(const HttpRequest &request, HttpResponse &response) const;

  [[nodiscard]] bool started() const noexcept { return _state == State::started; }

  [[nodiscard]] bool failed() const noexcept { return _state == State::failed; }

  [[nodiscard]] std::size_t size() const noexcept { return _interceptors.size(); }

 private:
  enum class State : std::uint8_t { attaching, started, failed };

  std::vector<std::unique_ptr<ResponseInterceptor>> _interceptors;
  State _state{State::attaching};
};

}  // namespace zipline
