#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace rspd {

// Location and rotation policy of one log stream (main, request or stats).
struct LogConfig {
  // Path of the active log file. A relative path is resolved against ServerConfig::rootDir.
  std::string location;

  // The active file is rotated before a write once its size reaches this many bytes.
  std::size_t maxSize{10UL * 1024UL * 1024UL};

  // The active file is rotated before a write once it has been open for this long.
  std::chrono::milliseconds maxAge{std::chrono::hours{1}};

  // When true, rotated files are deleted instead of being renamed to '<location>.r_<timestamp>_<seq>'.
  bool deleteRotation{false};

  LogConfig& withLocation(std::string_view location);
  LogConfig& withMaxSize(std::size_t maxSize);
  LogConfig& withMaxAge(std::chrono::milliseconds maxAge);
  LogConfig& withDeleteRotation(bool on = true);

  // Throws std::invalid_argument if not valid. 'streamName' is used in the error message.
  void validate(std::string_view streamName) const;

  bool operator==(const LogConfig&) const noexcept = default;
};

}  // namespace rspd
