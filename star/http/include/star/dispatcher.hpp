#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "star/error-page.hpp"
#include "star/http-method.hpp"
#include "star/http-response.hpp"
#include "star/request-snapshot.hpp"
#include "star/route-table.hpp"
#include "star/router-config.hpp"

namespace star {

struct MatchResult {
  enum class Outcome : std::uint8_t {
    Matched,   // pEntry and snapshot are set
    NotFound,  // no candidate matched
    Failed     // a candidate was reached but its pattern or parameters could not be processed
  };

  // Which rule matched the candidate.
  enum class Rule : std::uint8_t { None, Exact, Typed, Untyped };

  Outcome outcome{Outcome::NotFound};
  Rule rule{Rule::None};
  const RouteEntry* pEntry{nullptr};
  RequestSnapshot snapshot;
  std::string errorMessage;  // set for Outcome::Failed
};

// Resolves a request against a RouteTable and turns the outcome into a response.
// Holds references only: the RouteTable and ErrorPage must outlive it. All methods are const and
// may be called concurrently as long as the RouteTable is not modified.
class Dispatcher {
 public:
  Dispatcher(const RouteTable& routes, const ErrorPage& errorPage,
             RouterConfig::HandlerErrorStatus handlerErrorStatus) noexcept
      : _routes(routes), _errorPage(errorPage), _handlerErrorStatus(handlerErrorStatus) {}

  // Match target (path with optional query string) against the candidates of method.
  //
  // Candidates are scanned in registration order. For each candidate, rules are tried in this order,
  // and the scan stops at the first candidate that matches:
  //   1. Exact: normalized path equals the normalized pattern. No parameters.
  //   2. Typed: the pattern has typed placeholders and the path fully matches; captures are converted.
  //   3. Untyped: the pattern has untyped placeholders and the path fully matches; raw string captures.
  // Rules 2 and 3 are skipped when the normalized path is "/".
  // A target with query arguments is compared on its path only, so it matches exact routes through rule 1.
  // Query arguments never contribute positional parameters, they are only exposed through the snapshot.
  [[nodiscard]] MatchResult match(http::Method method, std::string_view target) const;

  // Match then invoke the handler. Never throws for request-level failures:
  //  - no match: 404 "404 Not Found" / "Page Not Found" page
  //  - handler, conversion or pattern failure: "500 Internal Server Error" page carrying the error text,
  //    with status 500 (or 200 under HandlerErrorStatus::AlwaysOk)
  [[nodiscard]] HttpResponse dispatch(http::Method method, std::string_view target) const;

 private:
  [[nodiscard]] HttpResponse failureResponse(std::string_view message) const;

  const RouteTable& _routes;
  const ErrorPage& _errorPage;
  RouterConfig::HandlerErrorStatus _handlerErrorStatus;
};

}  // namespace star
