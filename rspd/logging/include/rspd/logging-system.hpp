#pragma once

#include <spdlog/logger.h>

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "rspd/log-entry.hpp"
#include "rspd/log-queue.hpp"
#include "rspd/rotating-log-sink.hpp"
#include "rspd/server-config.hpp"
#include "rspd/timedef.hpp"

namespace rspd {

// Owns the three log streams (main, request, stats), the bounded queue feeding them and its consumer thread.
//
// Producers (request handling threads) only push to the queue and never block on file I/O.
// The consumer wakes every ServerConfig::logFlushInterval, drains the queue in FIFO order and writes each entry to its
// sink. While alive, the main logger is installed as the spdlog default logger.
class LoggingSystem {
 public:
  // Opens the log files (relative locations are resolved against config.rootDir) and starts the consumer.
  // Throws spdlog::spdlog_ex if a log file cannot be opened.
  explicit LoggingSystem(const ServerConfig& config);

  LoggingSystem(const LoggingSystem&) = delete;
  LoggingSystem(LoggingSystem&&) = delete;
  LoggingSystem& operator=(const LoggingSystem&) = delete;
  LoggingSystem& operator=(LoggingSystem&&) = delete;

  ~LoggingSystem();

  // Logger for MainEvents. Its sink feeds the queue.
  [[nodiscard]] const std::shared_ptr<spdlog::logger>& mainLogger() const noexcept { return _mainLogger; }

  // Non-blocking. Returns false if the entry was dropped.
  bool logRequest(RequestEvent event);
  bool logStats(StatsSnapshot snapshot);

  // Writes out the pending entries, then stops mirroring the main log to the console.
  void markStarted();

  // Number of entries dropped because the queue was full.
  [[nodiscard]] uint64_t droppedCount() const noexcept { return _queue->droppedCount(); }

  // Synchronously drains the queue to the sinks and flushes the files.
  void flush();

  // Stops the consumer after draining the remaining entries and restores the previous default logger.
  // Idempotent.
  void shutdown();

  [[nodiscard]] const RotatingLogSink& mainSink() const noexcept { return *_mainSink; }
  [[nodiscard]] const RotatingLogSink& requestSink() const noexcept { return *_requestSink; }
  [[nodiscard]] const RotatingLogSink& statsSink() const noexcept { return *_statsSink; }

 private:
  void consume(std::stop_token stopToken);
  void drainAndWrite();
  void write(const LogEntry& entry);

  std::shared_ptr<LogQueue> _queue;
  std::shared_ptr<RotatingLogSink> _mainSink;
  std::shared_ptr<RotatingLogSink> _requestSink;
  std::shared_ptr<RotatingLogSink> _statsSink;
  std::shared_ptr<spdlog::logger> _mainLogger;
  std::shared_ptr<spdlog::logger> _previousDefaultLogger;
  SysDuration _flushInterval;
  std::mutex _writeMutex;
  std::vector<LogEntry> _drained;
  std::mutex _wakeMutex;
  std::condition_variable_any _wakeCv;
  std::jthread _consumer;
};

}  // namespace rspd
