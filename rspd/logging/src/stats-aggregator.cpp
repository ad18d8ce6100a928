#include "rspd/stats-aggregator.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

#include "rspd/log-entry.hpp"
#include "rspd/timedef.hpp"

namespace rspd {

namespace {

constexpr auto kRelaxed = std::memory_order_relaxed;

std::chrono::microseconds ElapsedUs(SysTimePoint from, SysTimePoint to) {
  return std::chrono::duration_cast<std::chrono::microseconds>(to - from);
}

}  // namespace

void StatsAggregator::Counters::addLatency(uint64_t latencyUs) noexcept {
  latencyCount.fetch_add(1, kRelaxed);
  latencySumUs.fetch_add(latencyUs, kRelaxed);
  uint64_t currentMax = latencyMaxUs.load(kRelaxed);
  while (currentMax < latencyUs && !latencyMaxUs.compare_exchange_weak(currentMax, latencyUs, kRelaxed)) {
  }
}

StatsAggregator::StatsAggregator(SysTimePoint startTime) noexcept : _startTime(startTime), _windowStart(startTime) {}

void StatsAggregator::onConnect() noexcept {
  _conns.fetch_add(1, kRelaxed);
  _cumulative.connects.fetch_add(1, kRelaxed);
  _window.connects.fetch_add(1, kRelaxed);
}

void StatsAggregator::onDisconnect() noexcept { _conns.fetch_sub(1, kRelaxed); }

void StatsAggregator::onIdleDisconnect() noexcept {
  _cumulative.idleDisconnects.fetch_add(1, kRelaxed);
  _window.idleDisconnects.fetch_add(1, kRelaxed);
}

void StatsAggregator::onRequestTimeout() noexcept {
  _cumulative.requestTimeouts.fetch_add(1, kRelaxed);
  _window.requestTimeouts.fetch_add(1, kRelaxed);
}

void StatsAggregator::onRequest(std::chrono::microseconds latency) noexcept {
  const auto latencyUs = static_cast<uint64_t>(latency.count() < 0 ? 0 : latency.count());
  _cumulative.requests.fetch_add(1, kRelaxed);
  _window.requests.fetch_add(1, kRelaxed);
  _cumulative.addLatency(latencyUs);
  _window.addLatency(latencyUs);
}

StatsValues StatsAggregator::Read(const Counters& counters) noexcept {
  StatsValues values;
  values.requests = counters.requests.load(kRelaxed);
  values.connects = counters.connects.load(kRelaxed);
  values.idleDisconnects = counters.idleDisconnects.load(kRelaxed);
  values.requestTimeouts = counters.requestTimeouts.load(kRelaxed);
  values.latencyCount = counters.latencyCount.load(kRelaxed);
  values.latencySumUs = counters.latencySumUs.load(kRelaxed);
  values.latencyMaxUs = counters.latencyMaxUs.load(kRelaxed);
  return values;
}

StatsValues StatsAggregator::Exchange(Counters& counters) noexcept {
  StatsValues values;
  values.requests = counters.requests.exchange(0, kRelaxed);
  values.connects = counters.connects.exchange(0, kRelaxed);
  values.idleDisconnects = counters.idleDisconnects.exchange(0, kRelaxed);
  values.requestTimeouts = counters.requestTimeouts.exchange(0, kRelaxed);
  values.latencyCount = counters.latencyCount.exchange(0, kRelaxed);
  values.latencySumUs = counters.latencySumUs.exchange(0, kRelaxed);
  values.latencyMaxUs = counters.latencyMaxUs.exchange(0, kRelaxed);
  return values;
}

StatsValues StatsAggregator::cumulative(SysTimePoint now) const noexcept {
  StatsValues values = Read(_cumulative);
  values.conns = _conns.load(kRelaxed);
  values.elapsed = ElapsedUs(_startTime, now);
  return values;
}

StatsSnapshot StatsAggregator::snapshot(SysTimePoint now) {
  StatsSnapshot snapshot;
  snapshot.time = now;
  snapshot.cumulative = cumulative(now);
  snapshot.window = Exchange(_window);
  snapshot.window.conns = snapshot.cumulative.conns;
  snapshot.window.elapsed = ElapsedUs(_windowStart, now);
  _windowStart = now;
  return snapshot;
}

}  // namespace rspd
