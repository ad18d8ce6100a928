#include "rspd/rotating-log-sink.hpp"

#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/details/log_msg.h>
#include <spdlog/pattern_formatter.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "rspd/log-config.hpp"
#include "rspd/timedef.hpp"
#include "rspd/timestring.hpp"

namespace rspd {

RotatingLogSink::RotatingLogSink(std::string path, const LogConfig& config, std::string_view pattern,
                                 std::string headerLine, bool mirrorToConsole)
    : spdlog::sinks::base_sink<std::mutex>(
          std::make_unique<spdlog::pattern_formatter>(std::string(pattern), spdlog::pattern_time_type::utc)),
      _path(std::move(path)),
      _headerLine(std::move(headerLine)),
      _maxSize(config.maxSize),
      _maxAge(config.maxAge),
      _deleteRotation(config.deleteRotation),
      _mirrorToConsole(mirrorToConsole) {
  openFresh(SysClock::now());
}

void RotatingLogSink::sink_it_(const spdlog::details::log_msg& msg) {
  const SysTimePoint now = SysClock::now();
  if (_currentSize >= _maxSize || now - _openTime >= _maxAge) {
    rotate(now);
  }

  spdlog::memory_buf_t formatted;
  formatter_->format(msg, formatted);
  writeBuffer(formatted);
}

void RotatingLogSink::flush_() { _fileHelper.flush(); }

void RotatingLogSink::openFresh(SysTimePoint now) {
  _fileHelper.open(_path, false);
  _openTime = now;
  _currentSize = _fileHelper.size();
  if (_currentSize != 0) {
    // Appending to a file left by a previous run: its age counts from its last write.
    std::error_code ec;
    const auto lastWrite = std::filesystem::last_write_time(_path, ec);
    if (!ec) {
      _openTime = std::min(now, std::chrono::time_point_cast<SysDuration>(std::chrono::file_clock::to_sys(lastWrite)));
    }
  }
  if (_currentSize == 0 && !_headerLine.empty()) {
    spdlog::memory_buf_t header;
    header.append(_headerLine.data(), _headerLine.data() + _headerLine.size());
    header.push_back('\n');
    _fileHelper.write(header);
    _currentSize += header.size();
  }
}

void RotatingLogSink::rotate(SysTimePoint now) {
  _fileHelper.close();

  std::error_code ec;
  if (_deleteRotation) {
    std::filesystem::remove(_path, ec);
  } else {
    char timeBuf[kCompactTimeStrLen];
    const std::string_view timeStr(timeBuf, TimeToStringCompact(now, timeBuf));
    std::string rotatedPath;
    uint32_t seq = _nbRotations.load(std::memory_order_relaxed);
    do {
      rotatedPath = fmt::format("{}.r_{}_{}", _path, timeStr, seq++);
    } while (std::filesystem::exists(rotatedPath, ec));
    std::filesystem::rename(_path, rotatedPath, ec);
  }
  if (ec) {
    // The sink cannot report through the logging pipeline it is part of.
    fmt::print(stderr, "Unable to rotate log file '{}': {}\n", _path, ec.message());
  }
  _nbRotations.fetch_add(1, std::memory_order_relaxed);

  openFresh(now);
}

void RotatingLogSink::writeBuffer(const spdlog::memory_buf_t& buf) {
  _fileHelper.write(buf);
  _currentSize += buf.size();
  if (_mirrorToConsole.load(std::memory_order_relaxed)) {
    std::fwrite(buf.data(), 1, buf.size(), stdout);
    std::fflush(stdout);
  }
}

}  // namespace rspd
