#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "rspd/log-entry.hpp"
#include "rspd/timedef.hpp"

namespace rspd {

// Lock-free counters updated by any worker thread.
// Two counter sets are kept: cumulative since construction, and the current window which is read and reset by
// snapshot(), called by the single statistics timer.
class StatsAggregator {
 public:
  explicit StatsAggregator(SysTimePoint startTime = SysClock::now()) noexcept;

  void onConnect() noexcept;
  void onDisconnect() noexcept;
  void onIdleDisconnect() noexcept;
  void onRequestTimeout() noexcept;
  void onRequest(std::chrono::microseconds latency) noexcept;

  // Reads the cumulative counters and the current window, then starts a new window at 'now'.
  [[nodiscard]] StatsSnapshot snapshot(SysTimePoint now);

  [[nodiscard]] StatsValues cumulative(SysTimePoint now) const noexcept;

 private:
  struct Counters {
    std::atomic<uint64_t> requests{0};
    std::atomic<uint64_t> connects{0};
    std::atomic<uint64_t> idleDisconnects{0};
    std::atomic<uint64_t> requestTimeouts{0};
    std::atomic<uint64_t> latencyCount{0};
    std::atomic<uint64_t> latencySumUs{0};
    std::atomic<uint64_t> latencyMaxUs{0};

    void addLatency(uint64_t latencyUs) noexcept;
  };

  static StatsValues Read(const Counters& counters) noexcept;
  static StatsValues Exchange(Counters& counters) noexcept;

  Counters _cumulative;
  Counters _window;
  std::atomic<int64_t> _conns{0};
  SysTimePoint _startTime;
  SysTimePoint _windowStart;
};

}  // namespace rspd
