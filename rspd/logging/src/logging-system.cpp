#include "rspd/logging-system.hpp"

#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/details/log_msg.h>
#include <spdlog/logger.h>

#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>

#include "rspd/log-entry.hpp"
#include "rspd/log.hpp"
#include "rspd/queue-sink.hpp"
#include "rspd/rotating-log-sink.hpp"
#include "rspd/server-config.hpp"

namespace rspd {

namespace {

constexpr std::string_view kMainPattern = "[%Y-%m-%d %H:%M:%S.%e] (%l) %v";
constexpr std::string_view kRequestPattern = "[%Y-%m-%d %H:%M:%S.%e]: %v";
constexpr std::string_view kStatsPattern = "%v";

std::string ResolveLogPath(const ServerConfig& config, const LogConfig& logConfig) {
  std::filesystem::path path(logConfig.location);
  if (path.is_relative()) {
    path = std::filesystem::path(config.rootDir) / path;
  }
  return path.string();
}

spdlog::details::log_msg MakeMsg(SysTimePoint time, spdlog::level::level_enum level, std::string_view text) {
  return spdlog::details::log_msg(time, spdlog::source_loc{}, spdlog::string_view_t{}, level,
                                  spdlog::string_view_t(text.data(), text.size()));
}

}  // namespace

LoggingSystem::LoggingSystem(const ServerConfig& config)
    : _queue(std::make_shared<LogQueue>(config.maxLogQueue)),
      _mainSink(std::make_shared<RotatingLogSink>(ResolveLogPath(config, config.mainLog), config.mainLog,
                                                  kMainPattern, std::string{}, true)),
      _requestSink(std::make_shared<RotatingLogSink>(ResolveLogPath(config, config.requestLog), config.requestLog,
                                                     kRequestPattern, std::string(kRequestLogHeader))),
      _statsSink(std::make_shared<RotatingLogSink>(ResolveLogPath(config, config.statsLog), config.statsLog,
                                                   kStatsPattern)),
      _mainLogger(std::make_shared<spdlog::logger>("rspd", std::make_shared<QueueSink>(_queue))),
      _previousDefaultLogger(spdlog::default_logger()),
      _flushInterval(config.logFlushInterval),
      _consumer([this](std::stop_token stopToken) { consume(std::move(stopToken)); }) {
  const auto level = config.debug ? spdlog::level::debug : spdlog::level::info;
  _mainLogger->set_level(level);
  spdlog::set_default_logger(_mainLogger);
}

LoggingSystem::~LoggingSystem() { shutdown(); }

bool LoggingSystem::logRequest(RequestEvent event) { return _queue->tryPush(std::move(event)); }

bool LoggingSystem::logStats(StatsSnapshot snapshot) { return _queue->tryPush(std::move(snapshot)); }

void LoggingSystem::markStarted() {
  // Startup lines still queued must reach the console before the mirror goes off.
  drainAndWrite();
  _mainSink->setMirrorToConsole(false);
}

void LoggingSystem::flush() { drainAndWrite(); }

void LoggingSystem::shutdown() {
  if (!_consumer.joinable()) {
    return;
  }
  _consumer.request_stop();
  _consumer.join();
  if (spdlog::default_logger() == _mainLogger) {
    spdlog::set_default_logger(_previousDefaultLogger);
  }
  flush();
}

void LoggingSystem::consume(std::stop_token stopToken) {
  while (!stopToken.stop_requested()) {
    {
      std::unique_lock lock(_wakeMutex);
      _wakeCv.wait_for(lock, stopToken, _flushInterval, [] { return false; });
    }
    drainAndWrite();
  }
}

void LoggingSystem::drainAndWrite() {
  std::lock_guard lock(_writeMutex);
  _queue->drainTo(_drained);
  for (const LogEntry& entry : _drained) {
    try {
      write(entry);
    } catch (const std::exception& ex) {
      // The main log may be the failing stream.
      fmt::print(stderr, "Unable to write log entry: {}\n", ex.what());
    }
  }
  if (!_drained.empty()) {
    _drained.clear();
    _mainSink->flush();
    _requestSink->flush();
    _statsSink->flush();
  }
}

void LoggingSystem::write(const LogEntry& entry) {
  std::visit(
      [this](const auto& event) {
        using T = std::decay_t<decltype(event)>;
        if constexpr (std::is_same_v<T, MainEvent>) {
          _mainSink->log(MakeMsg(event.time, event.level, event.text));
        } else if constexpr (std::is_same_v<T, RequestEvent>) {
          const std::string line = FormatRequestLine(event);
          _requestSink->log(MakeMsg(event.time, spdlog::level::info, line));
        } else {
          for (const std::string& line : FormatStatsReport(event)) {
            _statsSink->log(MakeMsg(event.time, spdlog::level::info, line));
          }
        }
      },
      entry);
}

}  // namespace rspd
