#pragma once

#include "rspd/base-fd.hpp"

namespace rspd {

// Simple RAII class wrapping a Linux eventfd (non-blocking, close-on-exec).
// Used to wake up an event loop from another thread.
class EventFd {
 public:
  EventFd();

  // Send a wakeup event.
  void send() const noexcept;

  // Drain pending wakeup events.
  void read() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace rspd
