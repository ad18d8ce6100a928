#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "rspd/logging-system.hpp"
#include "rspd/server-config.hpp"
#include "rspd/server.hpp"
#include "rspd/temp-file.hpp"
#include "rspd/test-util.hpp"

namespace rspd::test {

// Lightweight RAII test server harness for integration tests.
//  * Each server gets its own temporary root directory (logs, webroot)
//  * Short poll and flush intervals so that timeouts and logs are observable quickly
//  * Stops on destruction
//
// Usage pattern:
//   TestServer ts;
//   ts.server.registerRustlet("/echo", ...);   // register before start()
//   ts.start();
//   auto resp = request(ts.port(), {.target = "/echo"});
struct TestServer {
  explicit TestServer(ServerConfig cfg = {}) : server(Prepare(std::move(cfg), root)) {}

  TestServer(const TestServer&) = delete;
  TestServer(TestServer&&) noexcept = delete;
  TestServer& operator=(const TestServer&) = delete;
  TestServer& operator=(TestServer&&) noexcept = delete;

  ~TestServer() { stop(); }

  void start() { server.start(); }

  void stop() { server.stop(); }

  [[nodiscard]] uint16_t port() const { return server.port(); }

  // Writes a page under the webroot.
  std::filesystem::path writePage(std::string_view relativePath, std::string_view content) const {
    return WriteFile(root, std::string("www/").append(relativePath), content);
  }

  [[nodiscard]] std::string mainLog() { return readLog("mainlog.log"); }
  [[nodiscard]] std::string requestLog() { return readLog("requestlog.log"); }
  [[nodiscard]] std::string statsLog() { return readLog("statslog.log"); }

  ScopedTempDir root;
  Server server;

 private:
  static ServerConfig Prepare(ServerConfig cfg, const ScopedTempDir& root) {
    cfg.rootDir = root.dirPath().string();
    cfg.bindAddress = "127.0.0.1:0";
    if (cfg.threadPoolSize == ServerConfig{}.threadPoolSize) {
      cfg.threadPoolSize = 2;
    }
    if (cfg.pollInterval == ServerConfig{}.pollInterval) {
      cfg.pollInterval = std::chrono::milliseconds{20};
    }
    if (cfg.logFlushInterval == ServerConfig{}.logFlushInterval) {
      cfg.logFlushInterval = std::chrono::milliseconds{10};
    }
    return cfg;
  }

  std::string readLog(std::string_view fileName) {
    if (LoggingSystem* logging = server.logging(); logging != nullptr) {
      logging->flush();
    }
    return ReadFile(root.dirPath() / "logs" / fileName);
  }
};

}  // namespace rspd::test
