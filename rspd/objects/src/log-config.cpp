#include "rspd/log-config.hpp"

#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string_view>

namespace rspd {

LogConfig& LogConfig::withLocation(std::string_view location) {
  this->location = location;
  return *this;
}

LogConfig& LogConfig::withMaxSize(std::size_t maxSize) {
  this->maxSize = maxSize;
  return *this;
}

LogConfig& LogConfig::withMaxAge(std::chrono::milliseconds maxAge) {
  this->maxAge = maxAge;
  return *this;
}

LogConfig& LogConfig::withDeleteRotation(bool on) {
  this->deleteRotation = on;
  return *this;
}

void LogConfig::validate(std::string_view streamName) const {
  if (location.empty()) {
    throw std::invalid_argument(fmt::format("{} log location must not be empty", streamName));
  }
  if (maxSize == 0) {
    throw std::invalid_argument(fmt::format("{} log maxSize must be > 0", streamName));
  }
  if (maxAge.count() <= 0) {
    throw std::invalid_argument(fmt::format("{} log maxAge must be > 0", streamName));
  }
}

}  // namespace rspd
