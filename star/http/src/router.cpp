#include "star/router.hpp"

#include <optional>
#include <span>
#include <string_view>
#include <utility>

#include "star/error-page.hpp"
#include "star/http-method-parse.hpp"
#include "star/http-method.hpp"
#include "star/path-handlers.hpp"
#include "star/router-config.hpp"
#include "star/router-errors.hpp"

namespace star {

namespace {

http::Method ParseMethodName(std::string_view methodName) {
  const std::optional<http::Method> method = http::MethodStrToOptEnum(methodName);
  if (!method) {
    throw InvalidMethod("Invalid method: {}", methodName);
  }
  return *method;
}

ErrorPage MakeErrorPage(const RouterConfig& config) {
  if (config.errorPageTemplatePath.empty()) {
    return ErrorPage{};
  }
  return ErrorPage::FromFile(config.errorPageTemplatePath);
}

}  // namespace

Router::Router(RouterConfig config) : _config(std::move(config)), _errorPage(MakeErrorPage(_config)) {}

void Router::route(std::string_view pattern, std::string_view methodName, RequestHandler handler) {
  setPath(ParseMethodName(methodName), pattern, std::move(handler));
}

void Router::route(std::string_view pattern, std::span<const std::string_view> methodNames, RequestHandler handler) {
  http::MethodBmp methods = 0;
  for (std::string_view methodName : methodNames) {
    methods = methods | ParseMethodName(methodName);
  }
  setPath(methods, pattern, std::move(handler));
}

void Router::setPath(http::MethodBmp methods, std::string_view pattern, RequestHandler handler) {
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    const http::Method method = http::MethodFromIdx(methodIdx);
    if (http::IsMethodSet(methods, method)) {
      _routes.add(method, pattern, handler);
    }
  }
}

void Router::setPath(http::Method method, std::string_view pattern, RequestHandler handler) {
  _routes.add(method, pattern, std::move(handler));
}

}  // namespace star
