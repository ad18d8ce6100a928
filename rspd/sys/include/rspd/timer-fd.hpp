#pragma once

#include "rspd/base-fd.hpp"
#include "rspd/timedef.hpp"

namespace rspd {

// Simple RAII wrapper around Linux timerfd.
// Triggers periodic maintenance work (timeout sweeps) from an epoll based event loop.
class TimerFd {
 public:
  // Create a disabled timerfd (non-blocking, close-on-exec).
  TimerFd();

  // Arm a periodic timer. A non-positive interval disables the timer.
  void armPeriodic(SysDuration interval) const;

  // Drain expirations (non-blocking).
  void drain() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace rspd
