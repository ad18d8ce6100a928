#include "rspd/dispatcher.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "rspd/http-status-code.hpp"
#include "rspd/request-context.hpp"
#include "rspd/request-parser.hpp"
#include "rspd/rsp-interpreter.hpp"
#include "rspd/rustlet-registry.hpp"
#include "rspd/rustlet.hpp"
#include "rspd/temp-file.hpp"

namespace rspd {

class DispatcherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry.registerRustlet("/echo", MakeRustlet([](RequestContext& ctx) { ctx.write(ctx.query()); }));
    registry.registerRustlet("/boom", MakeRustlet([](RequestContext&) { throw std::runtime_error("boom"); }));
    registry.registerRustlet("/panic", MakeRustlet([](RequestContext& ctx) {
                               ctx.write("partial output");
                               throw 42;
                             }));
    registry.addRustlet("header", MakeRustlet([](RequestContext& ctx) { ctx.write("H"); }));
    test::WriteFile(dir, "www/index.rsp", "<@=header>body");
    test::WriteFile(dir, "www/sub/Page.RSP", "sub");
    test::WriteFile(dir, "www/broken.rsp", "<@=header");
    test::WriteFile(dir, "www/unknown.rsp", "<@=nosuch>");
    test::WriteFile(dir, "secret.rsp", "secret");
  }

  std::shared_ptr<RequestContext> serve(std::string_view target) {
    const std::string raw = "GET " + std::string(target) + " HTTP/1.1\r\n\r\n";
    auto res = ParseRequest(raw, 4096, 4096);
    if (res.status != RequestParseResult::Status::Complete) {
      throw std::invalid_argument("test request does not parse");
    }
    dispatcher.dispatch(*res.request);
    return res.request;
  }

  test::ScopedTempDir dir;
  RustletRegistry registry;
  RspInterpreter interpreter{registry};
  Dispatcher dispatcher{registry, interpreter, (dir.dirPath() / "www/").string()};
};

TEST_F(DispatcherTest, TrailingSlashOfPageRootRemoved) {
  EXPECT_EQ(dispatcher.pageRoot(), (dir.dirPath() / "www").string());
}

TEST_F(DispatcherTest, RustletMapping) {
  auto ctx = serve("/echo?a=1");
  EXPECT_EQ(ctx->status(), http::StatusCodeOK);
  EXPECT_EQ(ctx->responseBody(), "a=1");
}

TEST_F(DispatcherTest, RspPage) {
  auto ctx = serve("/index.rsp");
  EXPECT_EQ(ctx->status(), http::StatusCodeOK);
  EXPECT_EQ(ctx->responseBody(), "Hbody");
  EXPECT_EQ(ctx->contentType(), "text/html");
}

TEST_F(DispatcherTest, RspExtensionIsCaseInsensitive) {
  auto ctx = serve("/sub/Page.RSP");
  EXPECT_EQ(ctx->responseBody(), "sub");
}

TEST_F(DispatcherTest, NotFound) {
  auto ctx = serve("/nothing");
  EXPECT_EQ(ctx->status(), http::StatusCodeNotFound);
  EXPECT_EQ(ctx->responseBody(), "404 Not Found");
  EXPECT_EQ(ctx->contentType(), "text/plain");

  EXPECT_EQ(serve("/missing.rsp")->status(), http::StatusCodeNotFound);
}

TEST_F(DispatcherTest, ParentSegmentsNotServed) {
  EXPECT_EQ(serve("/../secret.rsp")->status(), http::StatusCodeNotFound);
  EXPECT_EQ(serve("/sub/%2E%2E/%2E%2E/secret.rsp")->status(), http::StatusCodeNotFound);
}

TEST_F(DispatcherTest, MalformedPageIsBadRequest) {
  auto ctx = serve("/broken.rsp");
  EXPECT_EQ(ctx->status(), http::StatusCodeBadRequest);
  EXPECT_EQ(ctx->responseBody(), "400 Bad Request");
}

TEST_F(DispatcherTest, UnknownRustletInPageIsServerError) {
  EXPECT_EQ(serve("/unknown.rsp")->status(), http::StatusCodeInternalServerError);
}

TEST_F(DispatcherTest, HandlerExceptionIsServerError) {
  auto ctx = serve("/boom");
  EXPECT_EQ(ctx->status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(ctx->responseBody(), "500 Internal Server Error");
}

TEST_F(DispatcherTest, NonStandardExceptionDiscardsPartialOutput) {
  auto ctx = serve("/panic");
  EXPECT_EQ(ctx->status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(ctx->responseBody(), "500 Internal Server Error");
}

TEST(SetErrorResponse, ReplacesResponse) {
  RequestContext ctx;
  ctx.write("abc");
  ctx.addHeader("X-Custom", "1");
  ctx.setCookie("a", "b");
  SetErrorResponse(ctx, http::StatusCodeNotFound);
  EXPECT_EQ(ctx.status(), http::StatusCodeNotFound);
  EXPECT_EQ(ctx.responseBody(), "404 Not Found");
  EXPECT_TRUE(ctx.responseHeaders().empty());
  EXPECT_TRUE(ctx.outgoingCookies().empty());
}

}  // namespace rspd
