#include "star/request-snapshot.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "star/http-method.hpp"
#include "star/invalid-argument-exception.hpp"
#include "star/path-value.hpp"
#include "star/query-args.hpp"

namespace star {

TEST(RequestSnapshot, DefaultIsEmpty) {
  RequestSnapshot snapshot;
  EXPECT_EQ(snapshot.method(), http::Method::GET);
  EXPECT_TRUE(snapshot.path().empty());
  EXPECT_TRUE(snapshot.queryArgs().empty());
  EXPECT_TRUE(snapshot.pathParams().empty());
}

TEST(RequestSnapshot, QueryArg) {
  RequestSnapshot snapshot(http::Method::POST, "/search", ParseQueryArgs("q=shoes"));
  EXPECT_EQ(snapshot.method(), http::Method::POST);
  EXPECT_EQ(snapshot.path(), "/search");
  ASSERT_TRUE(snapshot.queryArg("q").has_value());
  EXPECT_EQ(*snapshot.queryArg("q"), "shoes");
  EXPECT_FALSE(snapshot.queryArg("page").has_value());
}

TEST(RequestSnapshot, TypedPathParams) {
  RequestSnapshot snapshot;
  snapshot.setPathParams({PathValue{int64_t{7}}, PathValue{2.5}, PathValue{std::string("x")}});
  ASSERT_EQ(snapshot.pathParams().size(), 3U);
  EXPECT_EQ(snapshot.pathParam<int64_t>(0), 7);
  EXPECT_DOUBLE_EQ(snapshot.pathParam<double>(1), 2.5);
  EXPECT_EQ(snapshot.pathParam<std::string>(2), "x");
}

TEST(RequestSnapshot, PathParamErrors) {
  RequestSnapshot snapshot;
  snapshot.setPathParams({PathValue{int64_t{7}}});
  EXPECT_THROW((void)snapshot.pathParam<int64_t>(1), invalid_argument);
  EXPECT_THROW((void)snapshot.pathParam<std::string>(0), invalid_argument);
}

}  // namespace star
