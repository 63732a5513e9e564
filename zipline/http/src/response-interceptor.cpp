#include "zipline/response-interceptor.hpp"

#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>

#include "zipline/http-request.hpp"
#include "zipline/http-response.hpp"
#include "zipline/log.hpp"
#include "zipline/server-config.hpp"

namespace zipline {

ResponseMiddleware MakeResponseMiddleware(std::shared_ptr<ResponseInterceptor> interceptor) {
  if (!interceptor) {
    throw std::invalid_argument("Cannot make a response middleware from an empty interceptor");
  }
  return [interceptor = std::move(interceptor)](const HttpRequest &request, HttpResponse &response) {
    interceptor->onResponse(request, response);
  };
}

InterceptorChain &InterceptorChain::attach(std::unique_ptr<ResponseInterceptor> interceptor) {
  if (_state != State::attaching) {
    throw std::logic_error("Cannot attach an interceptor after start()");
  }
  if (!interceptor) {
    throw std::invalid_argument("Cannot attach an empty interceptor");
  }
  log::debug("Attaching interceptor '{}'", interceptor->name());
  _interceptors.push_back(std::move(interceptor));
  return *this;
}

void InterceptorChain::start(const ServerConfig &config) {
  if (_state == State::started) {
    throw std::logic_error("Interceptor chain already started");
  }
  if (_state == State::failed) {
    throw std::logic_error("Interceptor chain failed to start");
  }
  for (auto &interceptor : _interceptors) {
    try {
      interceptor->onStartup(config);
    } catch (const std::exception &ex) {
      log::critical("Interceptor '{}' refused to start: {}", interceptor->name(), ex.what());
      _state = State::failed;
      throw;
    }
  }
  _state = State::started;
  log::info("{} response interceptor(s) started", _interceptors.size());
}

void InterceptorChain::onResponse(const HttpRequest &request, HttpResponse &response) const {
  if (_state != State::started) {
    throw std::logic_error("Interceptor chain used before start()");
  }
  for (const auto &interceptor : _interceptors) {
    try {
      interceptor->onResponse(request, response);
    } catch (const std::exception &ex) {
      log::error("Exception in response interceptor '{}': {}", interceptor->name(), ex.what());
    }
  }
}

}  // namespace zipline
