#include "rspd/url-decode.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <string>

namespace rspd {

namespace {
std::string decodePath(std::string input) {
  char* end = url::DecodeInPlace(input.data(), input.data() + input.size());
  if (end == nullptr) {
    return "<invalid>";
  }
  input.resize(static_cast<std::size_t>(end - input.data()));
  return input;
}
}  // namespace

TEST(UrlDecode, PercentSequences) {
  EXPECT_EQ(decodePath("/a%20b"), "/a b");
  EXPECT_EQ(decodePath("/%2Fslash"), "//slash");
  EXPECT_EQ(decodePath("/keep+plus"), "/keep+plus");
}

TEST(UrlDecode, StrictInvalidReturnsNull) {
  EXPECT_EQ(decodePath("/bad%2"), "<invalid>");
  EXPECT_EQ(decodePath("/bad%zz"), "<invalid>");
}

TEST(UrlDecode, QueryStringPairs) {
  auto params = url::ParseQueryString("a=1&b=x+y&c=%41%42&flag");
  ASSERT_EQ(params.size(), 4U);
  EXPECT_EQ(params[0].first, "a");
  EXPECT_EQ(params[0].second, "1");
  EXPECT_EQ(params[1].second, "x y");
  EXPECT_EQ(params[2].second, "AB");
  EXPECT_EQ(params[3].first, "flag");
  EXPECT_TRUE(params[3].second.empty());
}

TEST(UrlDecode, QueryStringKeepsDuplicatesAndSkipsEmptyPairs) {
  auto params = url::ParseQueryString("k=1&&k=2&");
  ASSERT_EQ(params.size(), 2U);
  EXPECT_EQ(params[0].second, "1");
  EXPECT_EQ(params[1].second, "2");
}

TEST(UrlDecode, QueryStringInvalidPercentKeptLiterally) {
  auto params = url::ParseQueryString("q=100%");
  ASSERT_EQ(params.size(), 1U);
  EXPECT_EQ(params[0].second, "100%");
}

}  // namespace rspd
