#include "rspd/log-entry.hpp"

#include <fmt/format.h>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "rspd/timestring.hpp"

namespace rspd {

namespace {

constexpr std::string_view kStatsLinePattern = "{:<8}{:>12}{:>8}{:>10}{:>10}{:>10}{:>10}{:>12}{:>12}";

std::string FormatStatsLine(std::string_view scope, const StatsValues& values) {
  return fmt::format(kStatsLinePattern, scope, values.requests, values.conns, values.connects,
                     fmt::format("{:.2f}", values.qps()), values.idleDisconnects, values.requestTimeouts,
                     fmt::format("{:.3f}", values.avgLatencyMs()), fmt::format("{:.3f}", values.maxLatencyMs()));
}

}  // namespace

double StatsValues::qps() const noexcept {
  if (elapsed.count() <= 0) {
    return 0.0;
  }
  return static_cast<double>(requests) * 1e6 / static_cast<double>(elapsed.count());
}

double StatsValues::avgLatencyMs() const noexcept {
  if (latencyCount == 0) {
    return 0.0;
  }
  return static_cast<double>(latencySumUs) / static_cast<double>(latencyCount) / 1000.0;
}

double StatsValues::maxLatencyMs() const noexcept { return static_cast<double>(latencyMaxUs) / 1000.0; }

std::string FormatRequestLine(const RequestEvent& event) {
  const double procTimeMs = static_cast<double>(event.procTime.count()) / 1000.0;
  return fmt::format("|{}|{}|{}|{}|{}|{:.3f}", event.method, event.uri, event.query, event.userAgent, event.referer,
                     procTimeMs);
}

std::vector<std::string> FormatStatsReport(const StatsSnapshot& snapshot) {
  std::vector<std::string> lines;
  lines.reserve(4);
  lines.push_back(fmt::format("Statistics Report: {}", TimeToStringLog(snapshot.time)));
  lines.push_back(fmt::format(kStatsLinePattern, "", "REQUESTS", "CONNS", "CONNECTS", "QPS", "IDLE_DISC", "RTIMEOUT",
                              "AVG_LAT", "MAX_LAT"));
  lines.push_back(FormatStatsLine("total", snapshot.cumulative));
  lines.push_back(FormatStatsLine("window", snapshot.window));
  return lines;
}

}  // namespace rspd
