#pragma once

#include <cstdint>
#include <span>

#include "rspd/base-fd.hpp"
#include "rspd/event.hpp"
#include "rspd/timedef.hpp"

namespace rspd {

// Thin RAII wrapper over epoll.
//
// The event buffer starts with kInitialCapacity slots and doubles each time a poll fills it.
// It never shrinks.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    EventFd(int fd, EventBmp eventBmp) : eventBmp(eventBmp), fd(fd) {}

    EventBmp eventBmp;
    int fd;
    uint32_t _padding;
  };

  EventLoop() noexcept = default;

  // Throws std::system_error if epoll cannot be created.
  explicit EventLoop(SysDuration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&& rhs) noexcept;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&& rhs) noexcept;

  ~EventLoop();

  // Register fd with given events. Throws std::system_error on error.
  void addOrThrow(EventFd event) const;

  // Register fd with given events. Returns false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Modify fd with given events. Returns false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Delete fd from monitoring.
  void del(int fd) const;

  // Polls for ready events up to the poll timeout.
  // Returns a span over an internal, reusable buffer.
  //  - timeout or EINTR: empty span with non-null data()
  //  - unrecoverable failure (logged): empty span with nullptr data()
  [[nodiscard]] std::span<const EventFd> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return _nbAllocatedEvents; }

 private:
  uint32_t _nbAllocatedEvents = 0;
  int _pollTimeoutMs = 0;
  BaseFd _baseFd;
  void* _pEvents = nullptr;
};

}  // namespace rspd
