#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

#include "rspd/http-status-code.hpp"
#include "rspd/request-context.hpp"
#include "rspd/server-config.hpp"
#include "rspd/test-util.hpp"
#include "rspd/timedef.hpp"
#include "test_server_fixture.hpp"

namespace rspd::test {

class HttpTimeoutsTest : public ::testing::Test {
 protected:
  HttpTimeoutsTest()
      : ts(ServerConfig{}
               .withRequestTimeout(std::chrono::milliseconds{100})
               .withIdleTimeout(std::chrono::milliseconds{300})
               .withStatsFrequency(std::chrono::milliseconds{50})) {
    ts.server.registerRustlet("/echo", [](RequestContext& ctx) { ctx.write(ctx.query()); });
    ts.start();
  }

  TestServer ts;
};

TEST_F(HttpTimeoutsTest, RequestTimeoutAnswers408) {
  ClientConnection cnx(ts.port());
  setRecvTimeout(cnx.fd(), std::chrono::seconds{2});
  sendAll(cnx.fd(), "GET /echo HTTP/1.1\r\n");
  const auto resp = parseResponse(recvUntilClosed(cnx.fd()));
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->statusCode, http::StatusCodeRequestTimeout);
  EXPECT_TRUE(WaitFor([this] { return ts.server.stats().cumulative(SysClock::now()).requestTimeouts == 1; },
                      std::chrono::seconds{1}));
}

TEST_F(HttpTimeoutsTest, IdleConnectionClosed) {
  ClientConnection cnx(ts.port());
  sendAll(cnx.fd(), "GET /echo?a HTTP/1.1\r\nHost: t\r\n\r\n");
  ASSERT_TRUE(parseResponse(recvWithTimeout(cnx.fd())));

  const auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(WaitForPeerClose(cnx.fd(), std::chrono::seconds{2}));
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds{200});

  const auto values = ts.server.stats().cumulative(SysClock::now());
  EXPECT_EQ(values.idleDisconnects, 1U);
  EXPECT_EQ(values.requestTimeouts, 0U);
}

TEST_F(HttpTimeoutsTest, StatsCounters) {
  for (int idx = 0; idx < 3; ++idx) {
    EXPECT_EQ(request(ts.port(), RequestOptions{.target = "/echo?s"}).statusCode, http::StatusCodeOK);
  }
  ASSERT_TRUE(WaitFor([this] { return ts.server.stats().cumulative(SysClock::now()).conns == 0; },
                      std::chrono::seconds{1}));
  const auto values = ts.server.stats().cumulative(SysClock::now());
  EXPECT_EQ(values.requests, 3U);
  EXPECT_EQ(values.connects, 3U);
  EXPECT_EQ(values.latencyCount, 3U);
  EXPECT_GE(values.latencyMaxUs * 3, values.latencySumUs);
}

TEST_F(HttpTimeoutsTest, PeriodicStatsReport) {
  ASSERT_EQ(request(ts.port(), RequestOptions{.target = "/echo?s"}).statusCode, http::StatusCodeOK);
  std::string statsLog;
  ASSERT_TRUE(WaitFor(
      [&] {
        statsLog = ts.statsLog();
        return statsLog.contains("Statistics Report") && statsLog.contains("window");
      },
      std::chrono::seconds{2}));
  EXPECT_TRUE(statsLog.contains("REQUESTS"));
  EXPECT_TRUE(statsLog.contains("IDLE_DISC"));
  EXPECT_TRUE(statsLog.contains("RTIMEOUT"));
}

TEST(HttpLogOverload, SaturatedLogQueueDoesNotAffectServing) {
  TestServer ts(ServerConfig{}.withMaxLogQueue(1).withLogFlushInterval(std::chrono::hours{1}));
  ts.server.registerRustlet("/echo", [](RequestContext& ctx) { ctx.write(ctx.query()); });
  ts.start();

  constexpr int kNbRequests = 10;
  for (int idx = 0; idx < kNbRequests; ++idx) {
    const auto resp = request(ts.port(), RequestOptions{.target = "/echo?n=" + std::to_string(idx)});
    EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
    EXPECT_EQ(resp.body, "n=" + std::to_string(idx));
  }

  EXPECT_EQ(ts.server.stats().cumulative(SysClock::now()).requests, static_cast<uint64_t>(kNbRequests));
  ASSERT_NE(ts.server.logging(), nullptr);
  EXPECT_GE(ts.server.logging()->droppedCount(), static_cast<uint64_t>(kNbRequests - 1));
}

TEST(HttpDescriptorReuse, ConnectionsReusingSweptDescriptorsAreServed) {
  TestServer ts(ServerConfig{}.withThreadPoolSize(1).withRequestTimeout(std::chrono::milliseconds{100}));
  ts.server.registerRustlet("/echo", [](RequestContext& ctx) { ctx.write(ctx.query()); });
  ts.start();

  for (int idx = 0; idx < 20; ++idx) {
    std::string stalled;
    {
      // Never completes its request: closed by the timeout sweep, freeing its descriptor on the server side.
      ClientConnection slow(ts.port());
      sendAll(slow.fd(), "GET /echo HTTP/1.1\r\n");
      std::this_thread::sleep_for(std::chrono::milliseconds{90 + (idx % 20)});

      ClientConnection cnx(ts.port());
      const std::string query = "i=" + std::to_string(idx);
      sendAll(cnx.fd(), "GET /echo?" + query + " HTTP/1.1\r\nHost: t\r\n\r\n");
      const auto resp = parseResponse(recvWithTimeout(cnx.fd()));
      ASSERT_TRUE(resp);
      EXPECT_EQ(resp->statusCode, http::StatusCodeOK);
      EXPECT_EQ(resp->body, query);

      setRecvTimeout(slow.fd(), std::chrono::seconds{2});
      stalled = recvUntilClosed(slow.fd());
    }
    EXPECT_TRUE(stalled.starts_with("HTTP/1.1 408"));
  }
}

}  // namespace rspd::test
