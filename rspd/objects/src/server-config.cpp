#include "rspd/server-config.hpp"

#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "rspd/log-config.hpp"

namespace rspd {

namespace {

std::string_view::size_type PortSeparatorPos(std::string_view bindAddress) {
  const auto pos = bindAddress.rfind(':');
  if (pos == std::string_view::npos || pos + 1 == bindAddress.size()) {
    throw std::invalid_argument(fmt::format("bindAddress '{}' should be of the form 'host:port'", bindAddress));
  }
  return pos;
}

std::string FormatLog(std::string_view name, const LogConfig& logConfig) {
  return fmt::format("{}_log: location={} max_size={} max_age={}ms delete_rotation={}\n", name,
                     logConfig.location, logConfig.maxSize, logConfig.maxAge.count(), logConfig.deleteRotation);
}

}  // namespace

std::string_view ServerConfig::bindHost() const {
  return std::string_view(bindAddress).substr(0, PortSeparatorPos(bindAddress));
}

uint16_t ServerConfig::bindPort() const {
  std::string_view portStr = std::string_view(bindAddress).substr(PortSeparatorPos(bindAddress) + 1);
  uint32_t port = 0;
  const auto [ptr, errc] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), port);
  if (errc != std::errc{} || ptr != portStr.data() + portStr.size() || port > std::numeric_limits<uint16_t>::max()) {
    throw std::invalid_argument(fmt::format("Invalid port in bindAddress '{}'", bindAddress));
  }
  return static_cast<uint16_t>(port);
}

void ServerConfig::validate() const {
  if (rootDir.empty()) {
    throw std::invalid_argument("rootDir must not be empty");
  }
  (void)bindPort();
  if (threadPoolSize == 0) {
    throw std::invalid_argument("threadPoolSize must be > 0");
  }
  mainLog.validate("main");
  requestLog.validate("request");
  statsLog.validate("stats");
  if (statsFrequency.count() <= 0) {
    throw std::invalid_argument("statsFrequency must be > 0");
  }
  if (maxLogQueue == 0) {
    throw std::invalid_argument("maxLogQueue must be > 0");
  }
  if (logFlushInterval.count() <= 0) {
    throw std::invalid_argument("logFlushInterval must be > 0");
  }
  if (sessionTimeout.count() <= 0) {
    throw std::invalid_argument("sessionTimeout must be > 0");
  }
  if (sessionSweepInterval.count() <= 0) {
    throw std::invalid_argument("sessionSweepInterval must be > 0");
  }
  if (idleTimeout.count() <= 0) {
    throw std::invalid_argument("idleTimeout must be > 0");
  }
  if (requestTimeout.count() <= 0) {
    throw std::invalid_argument("requestTimeout must be > 0");
  }
  if (asyncTimeout.count() < 0) {
    throw std::invalid_argument("asyncTimeout must be non-negative");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
  if (std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw std::invalid_argument("pollInterval value is too large");
  }
  if (maxHeaderBytes < 128) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (maxBodyBytes == 0) {
    throw std::invalid_argument("maxBodyBytes must be > 0");
  }
  if (serverName.empty() || serverName.find_first_of("\r\n") != std::string::npos) {
    throw std::invalid_argument("serverName must be a non-empty single line");
  }
  if (tlsCertFile.empty() != tlsKeyFile.empty()) {
    throw std::invalid_argument("Either both TLS certificate and private key or neither must be specified");
  }
}

std::string ServerConfig::logConfigString() const {
  std::string out;
  out.append(fmt::format("root_dir: {}\n", rootDir));
  out.append(fmt::format("webroot: {}\n", webroot));
  out.append(fmt::format("bind_address: {}\n", bindAddress));
  out.append(fmt::format("thread_pool_size: {}\n", threadPoolSize));
  out.append(FormatLog("main", mainLog));
  out.append(FormatLog("request", requestLog));
  out.append(FormatLog("stats", statsLog));
  out.append(fmt::format("stats_frequency: {}ms\n", statsFrequency.count()));
  out.append(fmt::format("max_log_queue: {}\n", maxLogQueue));
  out.append(fmt::format("log_flush_interval: {}ms\n", logFlushInterval.count()));
  out.append(fmt::format("session_timeout: {}ms\n", sessionTimeout.count()));
  out.append(fmt::format("session_sweep_interval: {}ms\n", sessionSweepInterval.count()));
  out.append(fmt::format("idle_timeout: {}ms\n", idleTimeout.count()));
  out.append(fmt::format("request_timeout: {}ms\n", requestTimeout.count()));
  out.append(fmt::format("async_timeout: {}ms\n", asyncTimeout.count()));
  out.append(fmt::format("max_header_bytes: {}\n", maxHeaderBytes));
  out.append(fmt::format("max_body_bytes: {}\n", maxBodyBytes));
  out.append(fmt::format("server_name: {}\n", serverName));
  out.append(fmt::format("rsp_cache: {}\n", rspCache));
  out.append(fmt::format("debug: {}\n", debug));
  out.append(fmt::format("tls: {}", tlsCertFile.empty() ? std::string("disabled")
                                                         : fmt::format("cert={} key={}", tlsCertFile, tlsKeyFile)));
  return out;
}

ServerConfig& ServerConfig::withRootDir(std::string_view rootDir) {
  this->rootDir = rootDir;
  return *this;
}

ServerConfig& ServerConfig::withWebroot(std::string_view webroot) {
  this->webroot = webroot;
  return *this;
}

ServerConfig& ServerConfig::withBindAddress(std::string_view bindAddress) {
  this->bindAddress = bindAddress;
  return *this;
}

ServerConfig& ServerConfig::withThreadPoolSize(uint32_t threadPoolSize) {
  this->threadPoolSize = threadPoolSize;
  return *this;
}

ServerConfig& ServerConfig::withMainLog(LogConfig logConfig) {
  this->mainLog = std::move(logConfig);
  return *this;
}

ServerConfig& ServerConfig::withRequestLog(LogConfig logConfig) {
  this->requestLog = std::move(logConfig);
  return *this;
}

ServerConfig& ServerConfig::withStatsLog(LogConfig logConfig) {
  this->statsLog = std::move(logConfig);
  return *this;
}

ServerConfig& ServerConfig::withStatsFrequency(std::chrono::milliseconds statsFrequency) {
  this->statsFrequency = statsFrequency;
  return *this;
}

ServerConfig& ServerConfig::withMaxLogQueue(std::size_t maxLogQueue) {
  this->maxLogQueue = maxLogQueue;
  return *this;
}

ServerConfig& ServerConfig::withLogFlushInterval(std::chrono::milliseconds interval) {
  this->logFlushInterval = interval;
  return *this;
}

ServerConfig& ServerConfig::withSessionTimeout(std::chrono::milliseconds timeout) {
  this->sessionTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withSessionSweepInterval(std::chrono::milliseconds interval) {
  this->sessionSweepInterval = interval;
  return *this;
}

ServerConfig& ServerConfig::withIdleTimeout(std::chrono::milliseconds timeout) {
  this->idleTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withRequestTimeout(std::chrono::milliseconds timeout) {
  this->requestTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withAsyncTimeout(std::chrono::milliseconds timeout) {
  this->asyncTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withPollInterval(std::chrono::milliseconds interval) {
  this->pollInterval = interval;
  return *this;
}

ServerConfig& ServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

ServerConfig& ServerConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

ServerConfig& ServerConfig::withServerName(std::string_view serverName) {
  this->serverName = serverName;
  return *this;
}

ServerConfig& ServerConfig::withRspCache(bool on) {
  this->rspCache = on;
  return *this;
}

ServerConfig& ServerConfig::withDebug(bool on) {
  this->debug = on;
  return *this;
}

ServerConfig& ServerConfig::withTlsCertKey(std::string_view certFile, std::string_view keyFile) {
  this->tlsCertFile = certFile;
  this->tlsKeyFile = keyFile;
  return *this;
}

}  // namespace rspd
