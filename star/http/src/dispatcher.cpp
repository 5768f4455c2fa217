#include "star/dispatcher.hpp"

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include "star/http-method.hpp"
#include "star/http-response.hpp"
#include "star/http-status-code.hpp"
#include "star/log.hpp"
#include "star/path-pattern.hpp"
#include "star/query-args.hpp"
#include "star/request-snapshot.hpp"
#include "star/request-target.hpp"
#include "star/router-config.hpp"
#include "star/router-errors.hpp"
#include "star/template-constants.hpp"

namespace star {

MatchResult Dispatcher::match(http::Method method, std::string_view target) const {
  const RequestTarget requestTarget = SplitRequestTarget(target);
  const std::string_view path = NormalizePath(requestTarget.path);

  MatchResult result;
  result.snapshot = RequestSnapshot(method, std::string(path),
                                    requestTarget.hasQuery ? ParseQueryArgs(requestTarget.query) : QueryArgs{});

  for (const RouteEntry& entry : _routes.candidates(method)) {
    if (path == entry.pattern) {
      result.outcome = MatchResult::Outcome::Matched;
      result.rule = MatchResult::Rule::Exact;
      result.pEntry = &entry;
      return result;
    }
    if (path == "/") {
      continue;
    }
    if (!entry.compiled) {
      result.outcome = MatchResult::Outcome::Failed;
      result.pEntry = &entry;
      result.errorMessage = entry.compileError;
      return result;
    }
    try {
      auto pathParams = entry.compiled->match(path);
      if (pathParams) {
        result.outcome = MatchResult::Outcome::Matched;
        result.rule = entry.compiled->mode == CompiledPattern::Mode::Typed ? MatchResult::Rule::Typed
                                                                           : MatchResult::Rule::Untyped;
        result.pEntry = &entry;
        result.snapshot.setPathParams(std::move(*pathParams));
        return result;
      }
    } catch (const ConversionError& ex) {
      result.outcome = MatchResult::Outcome::Failed;
      result.pEntry = &entry;
      result.errorMessage = ex.what();
      return result;
    }
  }
  return result;
}

HttpResponse Dispatcher::dispatch(http::Method method, std::string_view target) const {
  MatchResult result = match(method, target);
  switch (result.outcome) {
    case MatchResult::Outcome::NotFound:
      log::debug("{} {}: no route matched", http::MethodToStr(method), target);
      return HttpResponse(http::StatusCodeNotFound, _errorPage.render(kNotFoundTitle, kNotFoundMessage));
    case MatchResult::Outcome::Failed:
      log::error("{} {}: route '{}' failed before invocation: {}", http::MethodToStr(method), target,
                 result.pEntry->pattern, result.errorMessage);
      return failureResponse(result.errorMessage);
    case MatchResult::Outcome::Matched:
      break;
  }

  log::debug("{} {}: matched '{}' with {} parameter(s)", http::MethodToStr(method), target, result.pEntry->pattern,
             result.snapshot.pathParams().size());
  try {
    return HttpResponse(http::StatusCodeOK, result.pEntry->handler(result.snapshot));
  } catch (const std::exception& ex) {
    log::error("{} {}: handler of '{}' failed: {}", http::MethodToStr(method), target, result.pEntry->pattern,
               ex.what());
    return failureResponse(ex.what());
  } catch (...) {
    log::error("{} {}: handler of '{}' threw a non standard exception", http::MethodToStr(method), target,
               result.pEntry->pattern);
    return failureResponse("Unknown error");
  }
}

HttpResponse Dispatcher::failureResponse(std::string_view message) const {
  const http::StatusCode status = _handlerErrorStatus == RouterConfig::HandlerErrorStatus::AlwaysOk
                                      ? http::StatusCodeOK
                                      : http::StatusCodeInternalServerError;
  return HttpResponse(status, _errorPage.render(kInternalServerErrorTitle, message));
}

}  // namespace star
