#pragma once

#include <initializer_list>
#include <span>
#include <string_view>
#include <utility>

#include "star/dispatcher.hpp"
#include "star/error-page.hpp"
#include "star/http-method.hpp"
#include "star/http-response.hpp"
#include "star/path-handlers.hpp"
#include "star/route-table.hpp"
#include "star/router-config.hpp"

namespace star {

// Route registration API and entry point of dispatch.
//
// Routes are registered at startup, then the Router is handed over to the server which never
// modifies it again: dispatch only reads the Router, so it can serve concurrent requests without locking.
class Router {
 public:
  // Creates an empty Router with the default configuration (built-in error page, 500 on handler failure).
  Router() = default;

  // Creates an empty Router with the given configuration.
  // Throws std::system_error if config.errorPageTemplatePath is set but cannot be read.
  explicit Router(RouterConfig config);

  // Register handler for pattern and GET.
  void route(std::string_view pattern, RequestHandler handler) { get(pattern, std::move(handler)); }

  // Register handler for pattern and one method name (case-insensitive, "GET" or "POST").
  // Throws InvalidMethod for any other name.
  void route(std::string_view pattern, std::string_view methodName, RequestHandler handler);

  // Register handler for pattern and several method names.
  // All names are validated first: if one is invalid, InvalidMethod is thrown and nothing is registered.
  void route(std::string_view pattern, std::span<const std::string_view> methodNames, RequestHandler handler);

  void route(std::string_view pattern, std::initializer_list<std::string_view> methodNames, RequestHandler handler) {
    route(pattern, std::span<const std::string_view>(methodNames.begin(), methodNames.size()), std::move(handler));
  }

  // Register handler for pattern and a set of methods.
  // Pattern syntax: literal segments, "<kind:name>" typed placeholders (kind in {int, string, float})
  // and "<name>" untyped placeholders. A trailing slash is insignificant.
  // Registering the same (method, pattern) again silently replaces the handler, keeping its first position.
  // A typed placeholder naming an unknown converter does not throw here: the route is kept, a warning is
  // logged, and any request reaching it without matching its text exactly gets a 500 error page. As routes
  // are tried in registration order, this shadows the routes registered after it and turns would-be 404s
  // into 500s for that method.
  void setPath(http::MethodBmp methods, std::string_view pattern, RequestHandler handler);

  void setPath(http::Method method, std::string_view pattern, RequestHandler handler);

  void get(std::string_view pattern, RequestHandler handler) {
    setPath(http::Method::GET, pattern, std::move(handler));
  }

  void post(std::string_view pattern, RequestHandler handler) {
    setPath(http::Method::POST, pattern, std::move(handler));
  }

  // See Dispatcher::match.
  [[nodiscard]] MatchResult match(http::Method method, std::string_view target) const {
    return dispatcher().match(method, target);
  }

  // See Dispatcher::dispatch.
  [[nodiscard]] HttpResponse dispatch(http::Method method, std::string_view target) const {
    return dispatcher().dispatch(method, target);
  }

  [[nodiscard]] const RouteTable& routes() const noexcept { return _routes; }

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

  [[nodiscard]] const ErrorPage& errorPage() const noexcept { return _errorPage; }

  // Remove all registered routes. The configuration stays unchanged.
  void clear() noexcept { _routes.clear(); }

 private:
  [[nodiscard]] Dispatcher dispatcher() const noexcept {
    return Dispatcher(_routes, _errorPage, _config.handlerErrorStatus);
  }

  RouterConfig _config;
  ErrorPage _errorPage;
  RouteTable _routes;
};

}  // namespace star
