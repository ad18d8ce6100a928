#pragma once

#include <spdlog/details/file_helper.h>
#include <spdlog/details/log_msg.h>
#include <spdlog/sinks/base_sink.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

#include "rspd/log-config.hpp"
#include "rspd/timedef.hpp"

namespace rspd {

// File sink with size and age based rotation, usable as any spdlog sink.
//
// Before each write, if the active file reached LogConfig::maxSize bytes or is older than LogConfig::maxAge (a file
// reopened in append mode is aged from its last write time),
// it is closed, renamed to '<file>.r_<YYYYmmdd_HHMMSS>_<seq>' (or deleted if LogConfig::deleteRotation is set)
// and a fresh file is opened. Each fresh file starts with the header line, if not empty.
// Formatted lines can additionally be mirrored to the standard output.
class RotatingLogSink final : public spdlog::sinks::base_sink<std::mutex> {
 public:
  // Opens (appending) the log file at 'path', creating parent directories if needed.
  // Throws spdlog::spdlog_ex if the file cannot be opened.
  RotatingLogSink(std::string path, const LogConfig& config, std::string_view pattern, std::string headerLine = {},
                  bool mirrorToConsole = false);

  void setMirrorToConsole(bool on) noexcept { _mirrorToConsole.store(on, std::memory_order_relaxed); }

  [[nodiscard]] bool mirrorToConsole() const noexcept { return _mirrorToConsole.load(std::memory_order_relaxed); }

  [[nodiscard]] const std::string& path() const noexcept { return _path; }

  // Number of rotations performed since construction.
  [[nodiscard]] uint32_t nbRotations() const noexcept { return _nbRotations.load(std::memory_order_relaxed); }

 protected:
  void sink_it_(const spdlog::details::log_msg& msg) override;
  void flush_() override;

 private:
  void openFresh(SysTimePoint now);
  void rotate(SysTimePoint now);
  void writeBuffer(const spdlog::memory_buf_t& buf);

  spdlog::details::file_helper _fileHelper;
  std::string _path;
  std::string _headerLine;
  // Tracked here since the file size does not account for buffered bytes.
  std::size_t _currentSize{0};
  std::size_t _maxSize;
  SysDuration _maxAge;
  SysTimePoint _openTime;
  bool _deleteRotation;
  std::atomic<bool> _mirrorToConsole;
  std::atomic<uint32_t> _nbRotations{0};
};

}  // namespace rspd
