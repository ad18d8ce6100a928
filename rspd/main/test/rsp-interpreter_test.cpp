#include "rspd/rsp-interpreter.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "rspd/errors.hpp"
#include "rspd/request-context.hpp"
#include "rspd/rustlet-registry.hpp"
#include "rspd/rustlet.hpp"
#include "rspd/temp-file.hpp"

namespace rspd {

using Kind = RspSegment::Kind;

class RspInterpreterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry.addRustlet("header", MakeRustlet([this](RequestContext& ctx) {
                          ++nbHeaderCalls;
                          ctx.write("H");
                        }));
    registry.addRustlet("footer", MakeRustlet([](RequestContext& ctx) { ctx.write("F"); }));
    registry.addRustlet("path", MakeRustlet([](RequestContext& ctx) { ctx.write(ctx.path()); }));
  }

  RustletRegistry registry;
  int nbHeaderCalls{0};
  test::ScopedTempDir dir;
};

TEST(RspInterpreterParse, StaticOnly) {
  const auto doc = RspInterpreter::Parse("<html>plain</html>");
  ASSERT_EQ(doc.segments.size(), 1U);
  EXPECT_EQ(doc.segments[0], (RspSegment{Kind::Static, "<html>plain</html>"}));
}

TEST(RspInterpreterParse, EmptyPage) { EXPECT_TRUE(RspInterpreter::Parse("").segments.empty()); }

TEST(RspInterpreterParse, TagsAndStaticInOrder) {
  const auto doc = RspInterpreter::Parse("<html><@=header>mid<@= footer ></html>");
  ASSERT_EQ(doc.segments.size(), 5U);
  EXPECT_EQ(doc.segments[0], (RspSegment{Kind::Static, "<html>"}));
  EXPECT_EQ(doc.segments[1], (RspSegment{Kind::Invoke, "header"}));
  EXPECT_EQ(doc.segments[2], (RspSegment{Kind::Static, "mid"}));
  EXPECT_EQ(doc.segments[3], (RspSegment{Kind::Invoke, "footer"}));
  EXPECT_EQ(doc.segments[4], (RspSegment{Kind::Static, "</html>"}));
}

TEST(RspInterpreterParse, AdjacentTags) {
  const auto doc = RspInterpreter::Parse("<@=a><@=b>");
  ASSERT_EQ(doc.segments.size(), 2U);
  EXPECT_EQ(doc.segments[0].text, "a");
  EXPECT_EQ(doc.segments[1].text, "b");
}

TEST(RspInterpreterParse, OtherMarkupIsStatic) {
  const auto doc = RspInterpreter::Parse("<@ notatag> <% x %>");
  ASSERT_EQ(doc.segments.size(), 1U);
  EXPECT_EQ(doc.segments[0].kind, Kind::Static);
}

TEST(RspInterpreterParse, UnterminatedTag) {
  try {
    (void)RspInterpreter::Parse("abc<@=header");
    FAIL() << "expected MalformedDocument";
  } catch (const MalformedDocument& ex) {
    EXPECT_EQ(ex.offset(), 3U);
  }
}

TEST(RspInterpreterParse, EmptyName) {
  try {
    (void)RspInterpreter::Parse("<p><@=  ></p>");
    FAIL() << "expected MalformedDocument";
  } catch (const MalformedDocument& ex) {
    EXPECT_EQ(ex.offset(), 3U);
  }
}

TEST_F(RspInterpreterTest, ExecuteInterleavesOutput) {
  RspInterpreter interpreter(registry);
  RequestContext ctx;
  interpreter.execute(RspInterpreter::Parse("<html><@=header>mid<@=footer></html>"), ctx);
  EXPECT_EQ(ctx.responseBody(), "<html>HmidF</html>");
}

TEST_F(RspInterpreterTest, UnknownRustletHasNoSideEffect) {
  RspInterpreter interpreter(registry);
  RequestContext ctx;
  EXPECT_THROW(interpreter.execute(RspInterpreter::Parse("<@=header>x<@=nosuch>"), ctx), UnknownRustlet);
  EXPECT_TRUE(ctx.responseBody().empty());
  EXPECT_EQ(nbHeaderCalls, 0);
}

TEST_F(RspInterpreterTest, RenderMissingFile) {
  RspInterpreter interpreter(registry);
  RequestContext ctx;
  EXPECT_FALSE(interpreter.render((dir.dirPath() / "missing.rsp").string(), ctx));
}

TEST_F(RspInterpreterTest, RenderFile) {
  const auto page = test::WriteFile(dir, "pages/index.rsp", "<b><@=header></b>");
  RspInterpreter interpreter(registry);
  RequestContext ctx;
  ASSERT_TRUE(interpreter.render(page.string(), ctx));
  EXPECT_EQ(ctx.responseBody(), "<b>H</b>");
  EXPECT_EQ(interpreter.nbCachedPages(), 0U);
}

TEST_F(RspInterpreterTest, CacheReusedUntilModified) {
  const auto page = test::WriteFile(dir, "cached.rsp", "v1<@=footer>");
  RspInterpreter interpreter(registry, true);
  {
    RequestContext ctx;
    ASSERT_TRUE(interpreter.render(page.string(), ctx));
    EXPECT_EQ(ctx.responseBody(), "v1F");
  }
  {
    RequestContext ctx;
    ASSERT_TRUE(interpreter.render(page.string(), ctx));
    EXPECT_EQ(ctx.responseBody(), "v1F");
  }
  EXPECT_EQ(interpreter.nbCachedPages(), 1U);

  test::WriteFile(dir, "cached.rsp", "v2<@=header>");
  std::filesystem::last_write_time(page, std::filesystem::last_write_time(page) + std::chrono::seconds{2});
  RequestContext ctx;
  ASSERT_TRUE(interpreter.render(page.string(), ctx));
  EXPECT_EQ(ctx.responseBody(), "v2H");
  EXPECT_EQ(interpreter.nbCachedPages(), 1U);
}

TEST_F(RspInterpreterTest, TooLargePage) {
  const auto page = test::WriteFile(dir, "big.rsp", std::string(RspInterpreter::kMaxPageSize + 1, 'x'));
  RspInterpreter interpreter(registry);
  RequestContext ctx;
  EXPECT_THROW(interpreter.render(page.string(), ctx), std::length_error);
}

}  // namespace rspd
