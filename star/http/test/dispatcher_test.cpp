#include "star/dispatcher.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include "star/error-page.hpp"
#include "star/http-method.hpp"
#include "star/http-status-code.hpp"
#include "star/path-handlers.hpp"
#include "star/request-snapshot.hpp"
#include "star/route-table.hpp"
#include "star/router-config.hpp"

namespace star {

namespace {

RequestHandler Returning(std::string body) {
  return [body = std::move(body)](const RequestSnapshot&) { return body; };
}

bool Contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

}  // namespace

class DispatcherTest : public ::testing::Test {
 protected:
  [[nodiscard]] Dispatcher dispatcher(
      RouterConfig::HandlerErrorStatus status = RouterConfig::HandlerErrorStatus::InternalServerError) const {
    return Dispatcher(routes, errorPage, status);
  }

  [[nodiscard]] MatchResult match(std::string_view target, http::Method method = http::Method::GET) const {
    return dispatcher().match(method, target);
  }

  [[nodiscard]] HttpResponse dispatch(std::string_view target, http::Method method = http::Method::GET) const {
    return dispatcher().dispatch(method, target);
  }

  RouteTable routes;
  ErrorPage errorPage{std::string("<h1>{{ title }}</h1><p>{{ message }}</p>")};
};

TEST_F(DispatcherTest, ExactMatchWithAndWithoutTrailingSlash) {
  routes.add(http::Method::GET, "/about", Returning("about"));
  routes.add(http::Method::GET, "/contact/", Returning("contact"));

  for (std::string_view target : {"/about", "/about/", "/contact", "/contact/"}) {
    const auto result = match(target);
    ASSERT_EQ(result.outcome, MatchResult::Outcome::Matched) << target;
    EXPECT_EQ(result.rule, MatchResult::Rule::Exact) << target;
    EXPECT_TRUE(result.snapshot.pathParams().empty()) << target;
  }
  EXPECT_EQ(dispatch("/about/").body(), "about");
  EXPECT_EQ(dispatch("/contact").body(), "contact");
}

TEST_F(DispatcherTest, RootRoute) {
  routes.add(http::Method::GET, "/", Returning("home"));
  const auto response = dispatch("/");
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.body(), "home");
  EXPECT_EQ(dispatch("").body(), "home");
}

TEST_F(DispatcherTest, TypedIntParameter) {
  routes.add(http::Method::GET, "/user/<int:id>", Returning("user"));

  const auto result = match("/user/42");
  ASSERT_EQ(result.outcome, MatchResult::Outcome::Matched);
  EXPECT_EQ(result.rule, MatchResult::Rule::Typed);
  ASSERT_EQ(result.snapshot.pathParams().size(), 1U);
  EXPECT_EQ(std::get<int64_t>(result.snapshot.pathParams()[0]), 42);

  EXPECT_EQ(match("/user/abc").outcome, MatchResult::Outcome::NotFound);
  EXPECT_EQ(match("/user/42/").outcome, MatchResult::Outcome::Matched);
}

TEST_F(DispatcherTest, NonMatchingTypedRouteFallsThroughToNextCandidate) {
  routes.add(http::Method::GET, "/user/<int:id>", Returning("by id"));
  routes.add(http::Method::GET, "/user/<string:name>", Returning("by name"));

  EXPECT_EQ(dispatch("/user/42").body(), "by id");
  EXPECT_EQ(dispatch("/user/abc").body(), "by name");
}

TEST_F(DispatcherTest, UntypedParameter) {
  routes.add(http::Method::GET, "/item/<slug>", Returning("item"));

  const auto result = match("/item/red-shoes");
  ASSERT_EQ(result.outcome, MatchResult::Outcome::Matched);
  EXPECT_EQ(result.rule, MatchResult::Rule::Untyped);
  ASSERT_EQ(result.snapshot.pathParams().size(), 1U);
  EXPECT_EQ(std::get<std::string>(result.snapshot.pathParams()[0]), "red-shoes");

  EXPECT_EQ(match("/item/a/b").outcome, MatchResult::Outcome::NotFound);
}

TEST_F(DispatcherTest, TypedFloatParameterIsStrict) {
  routes.add(http::Method::GET, "/price/<float:p>", Returning("price"));

  const auto result = match("/price/3.14");
  ASSERT_EQ(result.outcome, MatchResult::Outcome::Matched);
  EXPECT_DOUBLE_EQ(std::get<double>(result.snapshot.pathParams()[0]), 3.14);

  EXPECT_EQ(match("/price/3").outcome, MatchResult::Outcome::NotFound);
  EXPECT_EQ(match("/price/1e5").outcome, MatchResult::Outcome::NotFound);
}

TEST_F(DispatcherTest, FirstMatchingCandidateInRegistrationOrderWins) {
  routes.add(http::Method::GET, "/page/<name>", Returning("dynamic"));
  routes.add(http::Method::GET, "/page/special", Returning("literal"));

  // The dynamic route is registered first: it wins even though the second one is an exact match.
  EXPECT_EQ(dispatch("/page/special").body(), "dynamic");
}

TEST_F(DispatcherTest, ExactRuleIsTriedBeforeDynamicRulesOfTheSameCandidate) {
  routes.add(http::Method::GET, "/files/<name>", Returning("files"));
  const auto result = match("/files/<name>");
  ASSERT_EQ(result.outcome, MatchResult::Outcome::Matched);
  EXPECT_EQ(result.rule, MatchResult::Rule::Exact);
  EXPECT_TRUE(result.snapshot.pathParams().empty());
}

TEST_F(DispatcherTest, DynamicRulesAreSkippedForRootPath) {
  routes.add(http::Method::GET, "/file/<uuid:id>", Returning("file"));
  // "//" normalizes to "/": the broken pattern is never compiled against it.
  EXPECT_EQ(match("//").outcome, MatchResult::Outcome::NotFound);
  EXPECT_EQ(match("/x").outcome, MatchResult::Outcome::Failed);
}

TEST_F(DispatcherTest, MethodsAreSeparated) {
  routes.add(http::Method::POST, "/submit", Returning("posted"));
  EXPECT_EQ(match("/submit", http::Method::GET).outcome, MatchResult::Outcome::NotFound);
  EXPECT_EQ(dispatch("/submit", http::Method::POST).body(), "posted");
}

TEST_F(DispatcherTest, NotFoundPage) {
  routes.add(http::Method::GET, "/about", Returning("about"));
  const auto response = dispatch("/nowhere");
  EXPECT_EQ(response.status(), http::StatusCodeNotFound);
  EXPECT_TRUE(Contains(response.body(), "404 Not Found"));
  EXPECT_TRUE(Contains(response.body(), "Page Not Found"));
}

TEST_F(DispatcherTest, NotFoundOnEmptyTable) {
  const auto response = dispatch("/");
  EXPECT_EQ(response.status(), http::StatusCodeNotFound);
  EXPECT_EQ(response.body(), "<h1>404 Not Found</h1><p>Page Not Found</p>");
}

TEST_F(DispatcherTest, FailingHandlerRendersInternalServerErrorPage) {
  routes.add(http::Method::GET, "/boom", [](const RequestSnapshot&) -> std::string {
    throw std::runtime_error("kaboom happened");
  });
  const auto response = dispatch("/boom");
  EXPECT_EQ(response.status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(response.body(), "<h1>500 Internal Server Error</h1><p>kaboom happened</p>");
}

TEST_F(DispatcherTest, FailingHandlerWithLegacyAlwaysOkStatus) {
  routes.add(http::Method::GET, "/boom", [](const RequestSnapshot&) -> std::string {
    throw std::runtime_error("kaboom happened");
  });
  const auto response = dispatcher(RouterConfig::HandlerErrorStatus::AlwaysOk).dispatch(http::Method::GET, "/boom");
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_TRUE(Contains(response.body(), "500 Internal Server Error"));
  EXPECT_TRUE(Contains(response.body(), "kaboom happened"));
}

TEST_F(DispatcherTest, NonStandardExceptionIsReportedAsUnknownError) {
  routes.add(http::Method::GET, "/boom", [](const RequestSnapshot&) -> std::string { throw 42; });
  const auto response = dispatch("/boom");
  EXPECT_EQ(response.status(), http::StatusCodeInternalServerError);
  EXPECT_TRUE(Contains(response.body(), "Unknown error"));
}

TEST_F(DispatcherTest, IntOverflowIsAPerRequestFailure) {
  routes.add(http::Method::GET, "/user/<int:id>", Returning("user"));
  const auto result = match("/user/99999999999999999999");
  EXPECT_EQ(result.outcome, MatchResult::Outcome::Failed);

  const auto response = dispatch("/user/99999999999999999999");
  EXPECT_EQ(response.status(), http::StatusCodeInternalServerError);
  EXPECT_TRUE(Contains(response.body(), "500 Internal Server Error"));
  EXPECT_TRUE(Contains(response.body(), "99999999999999999999"));
}

TEST_F(DispatcherTest, HugePathSegments) {
  routes.add(http::Method::GET, "/item/<slug>", PositionalHandler<std::string>([](const std::string& slug) {
               return std::to_string(slug.size());
             }));
  routes.add(http::Method::GET, "/user/<int:id>", Returning("user"));

  const std::string segment(128UL * 1024UL, 'x');
  const auto response = dispatch("/item/" + segment);
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.body(), std::to_string(segment.size()));

  EXPECT_EQ(dispatch("/user/" + segment).status(), http::StatusCodeNotFound);
  EXPECT_EQ(dispatch("/user/" + std::string(segment.size(), '1')).status(), http::StatusCodeInternalServerError);
}

TEST_F(DispatcherTest, UnknownConverterFailsTheRequestReachingIt) {
  routes.add(http::Method::GET, "/ok", Returning("ok"));
  routes.add(http::Method::GET, "/file/<uuid:id>", Returning("file"));

  // Candidates before the broken one are unaffected.
  EXPECT_EQ(dispatch("/ok").body(), "ok");

  const auto response = dispatch("/anything");
  EXPECT_EQ(response.status(), http::StatusCodeInternalServerError);
  EXPECT_TRUE(Contains(response.body(), "uuid"));
}

TEST_F(DispatcherTest, UnknownConverterShadowsLaterRoutes) {
  routes.add(http::Method::GET, "/file/<uuid:id>", Returning("file"));
  routes.add(http::Method::GET, "/later", Returning("later"));
  routes.add(http::Method::POST, "/later", Returning("posted"));

  // Its own text still matches exactly.
  EXPECT_EQ(dispatch("/file/<uuid:id>").body(), "file");

  EXPECT_EQ(match("/later").outcome, MatchResult::Outcome::Failed);
  EXPECT_EQ(dispatch("/later").status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(dispatch("/nowhere").status(), http::StatusCodeInternalServerError);

  // Other methods are unaffected.
  EXPECT_EQ(dispatch("/later", http::Method::POST).body(), "posted");
  EXPECT_EQ(dispatch("/nowhere", http::Method::POST).status(), http::StatusCodeNotFound);
}

TEST_F(DispatcherTest, QueryArgumentsOnExactRoute) {
  std::string seen;
  routes.add(http::Method::GET, "/search", [&seen](const RequestSnapshot& snapshot) {
    seen = std::string(snapshot.queryArg("a").value_or("")) + "," + std::string(snapshot.queryArg("b").value_or(""));
    return std::string("search");
  });

  const auto result = match("/search?a=1&b=2");
  ASSERT_EQ(result.outcome, MatchResult::Outcome::Matched);
  EXPECT_TRUE(result.snapshot.pathParams().empty());
  EXPECT_EQ(result.snapshot.queryArgs().size(), 2U);

  EXPECT_EQ(dispatch("/search/?a=1&b=2").body(), "search");
  EXPECT_EQ(seen, "1,2");
}

TEST_F(DispatcherTest, QueryArgumentsDoNotAlterPositionalParameters) {
  routes.add(http::Method::GET, "/user/<int:id>", PositionalHandler<int64_t>([](int64_t id) {
               return std::to_string(id);
             }));
  const auto result = match("/user/7?id=8&x=y");
  ASSERT_EQ(result.outcome, MatchResult::Outcome::Matched);
  ASSERT_EQ(result.snapshot.pathParams().size(), 1U);
  EXPECT_EQ(std::get<int64_t>(result.snapshot.pathParams()[0]), 7);
  EXPECT_EQ(*result.snapshot.queryArg("id"), "8");
  EXPECT_EQ(dispatch("/user/7?id=8").body(), "7");
}

TEST_F(DispatcherTest, QueryStringIsNotPartOfThePath) {
  routes.add(http::Method::GET, "/item/<slug>", Returning("item"));
  const auto result = match("/item/shoes?color=red");
  ASSERT_EQ(result.outcome, MatchResult::Outcome::Matched);
  EXPECT_EQ(std::get<std::string>(result.snapshot.pathParams()[0]), "shoes");
  EXPECT_EQ(result.snapshot.path(), "/item/shoes");
}

TEST_F(DispatcherTest, ReRegistrationInvokesOnlyTheLastHandler) {
  routes.add(http::Method::GET, "/v", Returning("first"));
  routes.add(http::Method::GET, "/v/", Returning("second"));
  EXPECT_EQ(dispatch("/v").body(), "second");
}

TEST_F(DispatcherTest, MixedPatternKeepsUntypedTokenLiteral) {
  routes.add(http::Method::GET, "/a/<int:id>/<slug>", Returning("mixed"));
  EXPECT_EQ(match("/a/1/shoes").outcome, MatchResult::Outcome::NotFound);
  EXPECT_EQ(dispatch("/a/1/<slug>").body(), "mixed");
}

TEST_F(DispatcherTest, SnapshotsAreIndependentPerCall) {
  routes.add(http::Method::GET, "/q", [](const RequestSnapshot& snapshot) {
    return std::string(snapshot.queryArg("v").value_or("none"));
  });
  EXPECT_EQ(dispatch("/q?v=1").body(), "1");
  EXPECT_EQ(dispatch("/q").body(), "none");
}

}  // namespace star
