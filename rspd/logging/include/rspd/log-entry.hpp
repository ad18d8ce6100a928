#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "rspd/log.hpp"
#include "rspd/timedef.hpp"

namespace rspd {

// Event of the main log (lifecycle, warnings, errors).
struct MainEvent {
  log::level::level_enum level{log::level::info};
  SysTimePoint time;
  std::string text;
};

// One served request, written to the request log.
struct RequestEvent {
  SysTimePoint time;
  std::string method;
  std::string uri;
  std::string query;
  std::string userAgent;
  std::string referer;
  std::chrono::microseconds procTime{};
};

// Values of one statistics counter set.
struct StatsValues {
  uint64_t requests{};
  int64_t conns{};
  uint64_t connects{};
  uint64_t idleDisconnects{};
  uint64_t requestTimeouts{};
  uint64_t latencyCount{};
  uint64_t latencySumUs{};
  uint64_t latencyMaxUs{};
  // Duration covered by these values, used to compute the QPS.
  std::chrono::microseconds elapsed{};

  [[nodiscard]] double qps() const noexcept;
  [[nodiscard]] double avgLatencyMs() const noexcept;
  [[nodiscard]] double maxLatencyMs() const noexcept;

  bool operator==(const StatsValues&) const noexcept = default;
};

// Statistics report: cumulative values since start and values of the last window.
struct StatsSnapshot {
  SysTimePoint time;
  StatsValues cumulative;
  StatsValues window;
};

using LogEntry = std::variant<MainEvent, RequestEvent, StatsSnapshot>;

inline constexpr std::string_view kRequestLogHeader = "|method|uri|query|User-Agent|Referer|ProcTime";

// '|method|uri|query|User-Agent|Referer|proc_time_ms'
std::string FormatRequestLine(const RequestEvent& event);

// Block header, column header, cumulative line and window line, in this order.
std::vector<std::string> FormatStatsReport(const StatsSnapshot& snapshot);

}  // namespace rspd
