#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "rspd/http-status-code.hpp"
#include "rspd/request-context.hpp"
#include "rspd/test-util.hpp"
#include "test_server_fixture.hpp"

namespace rspd::test {

namespace {

// Accumulates received bytes until 'nbResponses' status lines have been seen or the timeout expires.
std::string RecvResponses(int fd, int nbResponses, std::chrono::milliseconds timeout = std::chrono::seconds{2}) {
  std::string out;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (countOccurrences(out, "HTTP/1.") < nbResponses && std::chrono::steady_clock::now() < deadline) {
    out.append(recvWithTimeout(fd, std::chrono::milliseconds{50}));
  }
  return out;
}

}  // namespace

class HttpKeepAliveTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ts.server.registerRustlet("/echo", [](RequestContext& ctx) { ctx.write(ctx.query()); });
    ts.start();
  }

  TestServer ts;
};

TEST_F(HttpKeepAliveTest, Http11KeepsConnectionOpen) {
  ClientConnection cnx(ts.port());
  for (int idx = 0; idx < 3; ++idx) {
    sendAll(cnx.fd(), "GET /echo?" + std::to_string(idx) + " HTTP/1.1\r\nHost: t\r\n\r\n");
    const auto resp = parseResponse(recvWithTimeout(cnx.fd()));
    ASSERT_TRUE(resp);
    EXPECT_EQ(resp->body, std::to_string(idx));
    EXPECT_EQ(resp->header("Connection"), "keep-alive");
  }
}

TEST_F(HttpKeepAliveTest, ConnectionCloseHonored) {
  ClientConnection cnx(ts.port());
  sendAll(cnx.fd(), "GET /echo?a HTTP/1.1\r\nConnection: close\r\n\r\n");
  const auto resp = parseResponse(recvWithTimeout(cnx.fd()));
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->header("Connection"), "close");
  EXPECT_TRUE(WaitForPeerClose(cnx.fd(), std::chrono::seconds{1}));
}

TEST_F(HttpKeepAliveTest, Http10ClosesByDefault) {
  ClientConnection cnx(ts.port());
  sendAll(cnx.fd(), "GET /echo?a HTTP/1.0\r\n\r\n");
  const auto resp = parseResponse(recvWithTimeout(cnx.fd()));
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->header("Connection"), "close");
  EXPECT_TRUE(WaitForPeerClose(cnx.fd(), std::chrono::seconds{1}));
}

TEST_F(HttpKeepAliveTest, Http10KeepAliveOptIn) {
  ClientConnection cnx(ts.port());
  sendAll(cnx.fd(), "GET /echo?a HTTP/1.0\r\nConnection: Keep-Alive\r\n\r\n");
  const auto first = parseResponse(recvWithTimeout(cnx.fd()));
  ASSERT_TRUE(first);
  EXPECT_EQ(first->header("Connection"), "keep-alive");
  sendAll(cnx.fd(), "GET /echo?b HTTP/1.0\r\n\r\n");
  const auto second = parseResponse(recvWithTimeout(cnx.fd()));
  ASSERT_TRUE(second);
  EXPECT_EQ(second->body, "b");
}

TEST_F(HttpKeepAliveTest, PipelinedRequestsAnsweredInOrder) {
  ClientConnection cnx(ts.port());
  sendAll(cnx.fd(),
          "GET /echo?first HTTP/1.1\r\nHost: t\r\n\r\n"
          "GET /echo?second HTTP/1.1\r\nHost: t\r\n\r\n"
          "GET /echo?third HTTP/1.1\r\nHost: t\r\n\r\n");
  const std::string raw = RecvResponses(cnx.fd(), 3);
  ASSERT_EQ(countOccurrences(raw, "HTTP/1.1 200"), 3);
  const auto first = raw.find("first");
  const auto second = raw.find("second");
  const auto third = raw.find("third");
  ASSERT_NE(third, std::string::npos);
  EXPECT_LT(first, second);
  EXPECT_LT(second, third);
}

TEST_F(HttpKeepAliveTest, RequestSplitAcrossWrites) {
  ClientConnection cnx(ts.port());
  sendAll(cnx.fd(), "GET /echo?sp");
  EXPECT_TRUE(recvWithTimeout(cnx.fd(), std::chrono::milliseconds{50}).empty());
  sendAll(cnx.fd(), "lit HTTP/1.1\r\nHo");
  sendAll(cnx.fd(), "st: t\r\n\r\n");
  const auto resp = parseResponse(recvWithTimeout(cnx.fd()));
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->body, "split");
}

}  // namespace rspd::test
