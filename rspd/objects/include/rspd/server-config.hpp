#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "rspd/http-constants.hpp"
#include "rspd/log-config.hpp"

namespace rspd {

struct ServerConfig {
  // ============================
  // Files
  // ============================
  // Base directory of the server. Relative log locations and the webroot are resolved against it.
  std::string rootDir{"."};

  // Directory holding the .rsp pages, relative to rootDir (or absolute).
  std::string webroot{"www"};

  // ============================
  // Listener / workers
  // ============================
  // 'host:port' to listen on. Port 0 lets the OS pick an ephemeral port, retrievable with Server::port().
  std::string bindAddress{"0.0.0.0:8080"};

  // Number of worker threads, each one running its own event loop.
  uint32_t threadPoolSize{8};

  // ============================
  // Logging & statistics
  // ============================
  LogConfig mainLog{"logs/mainlog.log"};
  LogConfig requestLog{"logs/requestlog.log"};
  LogConfig statsLog{"logs/statslog.log"};

  // Interval between two statistics reports.
  std::chrono::milliseconds statsFrequency{std::chrono::seconds{10}};

  // Capacity of the asynchronous log queue. Entries beyond it are dropped and counted.
  std::size_t maxLogQueue{100000};

  // Wake-up interval of the log consumer thread.
  std::chrono::milliseconds logFlushInterval{std::chrono::milliseconds{100}};

  // ============================
  // Sessions
  // ============================
  std::chrono::milliseconds sessionTimeout{std::chrono::minutes{30}};
  std::chrono::milliseconds sessionSweepInterval{std::chrono::seconds{10}};

  // ============================
  // Connection timeouts
  // ============================
  // Connections without activity for this long are closed (IDLE_DISC).
  std::chrono::milliseconds idleTimeout{std::chrono::minutes{2}};

  // Connections that do not complete a first request within this delay are closed (RTIMEOUT).
  std::chrono::milliseconds requestTimeout{std::chrono::seconds{30}};

  // Maximum time a request may stay detached in an async context. 0 disables the limit.
  std::chrono::milliseconds asyncTimeout{std::chrono::seconds{60}};

  // Maximum duration a worker blocks in epoll_wait when idle.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{500}};

  // ============================
  // Request parsing limits
  // ============================
  // Request line + headers + CRLFCRLF. Exceeding it yields 431.
  std::size_t maxHeaderBytes{16UL * 1024UL};

  // Exceeding it yields 413.
  std::size_t maxBodyBytes{16UL * 1024UL * 1024UL};

  // ============================
  // Misc
  // ============================
  // Value of the 'Server' response header.
  std::string serverName{http::DefaultServerName};

  // Cache parsed .rsp documents keyed by path and modification time.
  bool rspCache{false};

  // Lowers the main log level to debug.
  bool debug{false};

  // Optional TLS material. Both or neither must be set. Loading them is left to the embedding application.
  std::string tlsCertFile;
  std::string tlsKeyFile;

  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;

  // Splits bindAddress into its host and port parts.
  // Throws std::invalid_argument if it is not of the form 'host:port'.
  [[nodiscard]] std::string_view bindHost() const;
  [[nodiscard]] uint16_t bindPort() const;

  // Multi-line human readable dump of the resolved configuration, echoed to the main log at startup.
  [[nodiscard]] std::string logConfigString() const;

  ServerConfig& withRootDir(std::string_view rootDir);
  ServerConfig& withWebroot(std::string_view webroot);
  ServerConfig& withBindAddress(std::string_view bindAddress);
  ServerConfig& withThreadPoolSize(uint32_t threadPoolSize);
  ServerConfig& withMainLog(LogConfig logConfig);
  ServerConfig& withRequestLog(LogConfig logConfig);
  ServerConfig& withStatsLog(LogConfig logConfig);
  ServerConfig& withStatsFrequency(std::chrono::milliseconds statsFrequency);
  ServerConfig& withMaxLogQueue(std::size_t maxLogQueue);
  ServerConfig& withLogFlushInterval(std::chrono::milliseconds interval);
  ServerConfig& withSessionTimeout(std::chrono::milliseconds timeout);
  ServerConfig& withSessionSweepInterval(std::chrono::milliseconds interval);
  ServerConfig& withIdleTimeout(std::chrono::milliseconds timeout);
  ServerConfig& withRequestTimeout(std::chrono::milliseconds timeout);
  ServerConfig& withAsyncTimeout(std::chrono::milliseconds timeout);
  ServerConfig& withPollInterval(std::chrono::milliseconds interval);
  ServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);
  ServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);
  ServerConfig& withServerName(std::string_view serverName);
  ServerConfig& withRspCache(bool on = true);
  ServerConfig& withDebug(bool on = true);
  ServerConfig& withTlsCertKey(std::string_view certFile, std::string_view keyFile);

  bool operator==(const ServerConfig&) const noexcept = default;
};

}  // namespace rspd
