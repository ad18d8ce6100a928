#include "rspd/server.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

#include "rspd/request-context.hpp"
#include "rspd/server-config.hpp"
#include "rspd/temp-file.hpp"
#include "rspd/test-util.hpp"

namespace rspd {

using namespace std::chrono_literals;

class ServerTest : public ::testing::Test {
 protected:
  ServerConfig config() const {
    return ServerConfig{}
        .withRootDir(dir.dirPath().string())
        .withBindAddress("127.0.0.1:0")
        .withThreadPoolSize(2)
        .withPollInterval(20ms)
        .withLogFlushInterval(10ms);
  }

  test::ScopedTempDir dir;
};

TEST_F(ServerTest, StartAndStop) {
  Server server(config());
  server.registerRustlet("/ping", [](RequestContext& ctx) { ctx.write("pong"); });
  EXPECT_FALSE(server.isRunning());
  EXPECT_EQ(server.port(), 0);
  EXPECT_EQ(server.logging(), nullptr);

  server.start();
  EXPECT_TRUE(server.isRunning());
  EXPECT_NE(server.port(), 0);
  ASSERT_NE(server.logging(), nullptr);
  EXPECT_TRUE(server.registry().isFrozen());

  const auto resp = test::request(server.port(), test::RequestOptions{.target = "/ping"});
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.body, "pong");

  server.stop();
  EXPECT_FALSE(server.isRunning());
  server.stop();

  EXPECT_TRUE(std::filesystem::exists(dir.dirPath() / "logs" / "mainlog.log"));
  EXPECT_TRUE(std::filesystem::exists(dir.dirPath() / "logs" / "requestlog.log"));
  EXPECT_TRUE(std::filesystem::exists(dir.dirPath() / "logs" / "statslog.log"));
}

TEST_F(ServerTest, MainLogEchoesConfiguration) {
  {
    Server server(config().withServerName("custom-name"));
    server.start();
  }
  const std::string mainLog = test::ReadFile(dir.dirPath() / "logs" / "mainlog.log");
  EXPECT_TRUE(mainLog.contains("custom-name"));
  EXPECT_TRUE(mainLog.contains("Server started"));
  EXPECT_TRUE(mainLog.contains("Server stopped"));
}

TEST_F(ServerTest, StartupLinesAreMirroredToConsoleUntilStarted) {
  Server server(config().withServerName("console-name").withLogFlushInterval(1h));
  testing::internal::CaptureStdout();
  server.start();
  const std::string console = testing::internal::GetCapturedStdout();
  EXPECT_TRUE(console.contains("console-name"));
  EXPECT_TRUE(console.contains("Server started"));
  ASSERT_NE(server.logging(), nullptr);
  EXPECT_FALSE(server.logging()->mainSink().mirrorToConsole());
  server.stop();
}

TEST_F(ServerTest, CannotStartTwice) {
  Server server(config());
  server.start();
  EXPECT_THROW(server.start(), std::logic_error);
  server.stop();
  EXPECT_THROW(server.start(), std::logic_error);
}

TEST_F(ServerTest, RegistrationAfterStartRejected) {
  Server server(config());
  server.start();
  EXPECT_THROW(server.registerRustlet("/late", [](RequestContext&) {}), std::logic_error);
}

TEST_F(ServerTest, InvalidConfigRejected) {
  Server server(config().withThreadPoolSize(0));
  EXPECT_THROW(server.start(), std::invalid_argument);
  EXPECT_FALSE(server.isRunning());
}

TEST_F(ServerTest, PortAlreadyInUse) {
  Server first(config());
  first.start();
  Server second(config().withBindAddress("127.0.0.1:" + std::to_string(first.port())));
  EXPECT_THROW(second.start(), std::system_error);
  EXPECT_FALSE(second.isRunning());
}

TEST_F(ServerTest, DestructorStops) {
  uint16_t port = 0;
  {
    Server server(config());
    server.start();
    port = server.port();
  }
  EXPECT_THROW((void)test::ClientConnection(port, 50ms), std::runtime_error);
}

}  // namespace rspd
