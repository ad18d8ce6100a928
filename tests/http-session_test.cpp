#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <string_view>
#include <utility>

#include "rspd/http-status-code.hpp"
#include "rspd/request-context.hpp"
#include "rspd/server-config.hpp"
#include "rspd/session-store.hpp"
#include "rspd/test-util.hpp"
#include "test_server_fixture.hpp"

namespace rspd::test {

namespace {

// 'rspdsessionid=<id>' from the Set-Cookie header of a response.
std::string SessionCookie(const ParsedResponse& resp) {
  for (std::string_view value : resp.headerValues("Set-Cookie")) {
    if (value.starts_with(kSessionCookieName)) {
      return std::string(value.substr(0, value.find(';')));
    }
  }
  return {};
}

RequestOptions WithCookie(std::string target, std::string_view cookie) {
  RequestOptions opt{.target = std::move(target)};
  if (!cookie.empty()) {
    opt.headers.emplace_back("Cookie", std::string(cookie));
  }
  return opt;
}

}  // namespace

class HttpSessionTest : public ::testing::Test {
 protected:
  explicit HttpSessionTest(ServerConfig cfg = ServerConfig{}) : ts(std::move(cfg)) {}

  void SetUp() override {
    ts.server.registerRustlet("/set_session", [](RequestContext& ctx) {
      const auto value = ctx.queryParam("abc");
      ctx.session().set("abc", value.value_or(""));
      ctx.write("set");
    });
    ts.server.registerRustlet("/get_session", [](RequestContext& ctx) {
      ctx.write(ctx.session().get("abc").value_or("none"));
    });
    ts.server.registerRustlet("/delete_abc", [](RequestContext& ctx) {
      ctx.write(ctx.session().erase("abc") ? "erased" : "absent");
    });
    ts.server.registerRustlet("/delete_session", [](RequestContext& ctx) {
      ctx.session().invalidate();
      ctx.write("invalidated");
    });
    ts.server.registerRustlet("/cookies", [](RequestContext& ctx) {
      for (const auto& [name, value] : ctx.cookies()) {
        ctx.print("{}={};", name, value);
      }
      ctx.setCookie("visited", "yes", "path=/; HttpOnly");
    });
    ts.start();
  }

  TestServer ts;
};

TEST_F(HttpSessionTest, ValuePersistsAcrossRequests) {
  const auto first = request(ts.port(), RequestOptions{.target = "/set_session?abc=42"});
  ASSERT_EQ(first.statusCode, http::StatusCodeOK);
  const std::string cookie = SessionCookie(first);
  ASSERT_FALSE(cookie.empty());

  const auto second = request(ts.port(), WithCookie("/get_session", cookie));
  EXPECT_EQ(second.body, "42");
  EXPECT_TRUE(SessionCookie(second).empty());
  EXPECT_EQ(ts.server.sessions().size(), 1U);
}

TEST_F(HttpSessionTest, NoCookieMeansNewSession) {
  ASSERT_FALSE(SessionCookie(request(ts.port(), RequestOptions{.target = "/set_session?abc=1"})).empty());
  const auto resp = request(ts.port(), RequestOptions{.target = "/get_session"});
  EXPECT_EQ(resp.body, "none");
  EXPECT_FALSE(SessionCookie(resp).empty());
  EXPECT_EQ(ts.server.sessions().size(), 2U);
}

TEST_F(HttpSessionTest, EraseValue) {
  const std::string cookie = SessionCookie(request(ts.port(), RequestOptions{.target = "/set_session?abc=1"}));
  EXPECT_EQ(request(ts.port(), WithCookie("/delete_abc", cookie)).body, "erased");
  EXPECT_EQ(request(ts.port(), WithCookie("/delete_abc", cookie)).body, "absent");
  EXPECT_EQ(request(ts.port(), WithCookie("/get_session", cookie)).body, "none");
}

TEST_F(HttpSessionTest, InvalidateSession) {
  const std::string cookie = SessionCookie(request(ts.port(), RequestOptions{.target = "/set_session?abc=1"}));
  EXPECT_EQ(request(ts.port(), WithCookie("/delete_session", cookie)).body, "invalidated");
  EXPECT_EQ(ts.server.sessions().size(), 0U);

  const auto resp = request(ts.port(), WithCookie("/get_session", cookie));
  EXPECT_EQ(resp.body, "none");
  EXPECT_NE(SessionCookie(resp), cookie);
}

TEST_F(HttpSessionTest, Cookies) {
  const auto resp = request(ts.port(), WithCookie("/cookies", "a=1; b=two"));
  EXPECT_EQ(resp.body, "a=1;b=two;");
  const auto setCookies = resp.headerValues("Set-Cookie");
  ASSERT_EQ(setCookies.size(), 1U);
  EXPECT_EQ(setCookies[0], "visited=yes; path=/; HttpOnly");
}

class HttpSessionExpiryTest : public HttpSessionTest {
 protected:
  HttpSessionExpiryTest()
      : HttpSessionTest(ServerConfig{}
                            .withSessionTimeout(std::chrono::milliseconds{100})
                            .withSessionSweepInterval(std::chrono::milliseconds{20})) {}
};

TEST_F(HttpSessionExpiryTest, ExpiredSessionsAreSwept) {
  const std::string cookie = SessionCookie(request(ts.port(), RequestOptions{.target = "/set_session?abc=1"}));
  ASSERT_FALSE(cookie.empty());
  EXPECT_EQ(ts.server.sessions().size(), 1U);
  EXPECT_TRUE(WaitFor([this] { return ts.server.sessions().size() == 0; }, std::chrono::seconds{2}));

  const auto resp = request(ts.port(), WithCookie("/get_session", cookie));
  EXPECT_EQ(resp.body, "none");
  EXPECT_FALSE(SessionCookie(resp).empty());
}

}  // namespace rspd::test
