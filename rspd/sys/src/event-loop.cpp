#include "rspd/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <new>
#include <span>
#include <type_traits>
#include <utility>

#include "rspd/base-fd.hpp"
#include "rspd/errno-throw.hpp"
#include "rspd/event.hpp"
#include "rspd/log.hpp"
#include "rspd/timedef.hpp"

namespace rspd {

namespace {

static_assert(std::is_trivially_copyable_v<epoll_event> && std::is_standard_layout_v<epoll_event>);
static_assert(std::is_trivially_copyable_v<EventLoop::EventFd> && std::is_standard_layout_v<EventLoop::EventFd>);
static_assert(sizeof(epoll_event) >= sizeof(EventLoop::EventFd));

static_assert(EventIn == EPOLLIN);
static_assert(EventOut == EPOLLOUT);
static_assert(EventErr == EPOLLERR);
static_assert(EventHup == EPOLLHUP);
static_assert(EventRdHup == EPOLLRDHUP);
static_assert(EventEt == EPOLLET);

int ToMilliseconds(SysDuration dur) {
  return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(dur).count());
}

}  // namespace

EventLoop::EventLoop(SysDuration pollTimeout, uint32_t initialCapacity)
    : _nbAllocatedEvents(std::max(1U, initialCapacity)),
      _pollTimeoutMs(ToMilliseconds(pollTimeout)),
      _baseFd(::epoll_create1(EPOLL_CLOEXEC)),
      _pEvents(std::malloc(static_cast<std::size_t>(_nbAllocatedEvents) * sizeof(epoll_event))) {
  if (_pEvents == nullptr) {
    throw std::bad_alloc();
  }
  if (!_baseFd) {
    std::free(_pEvents);
    throw_errno("epoll_create1 failed");
  }
  log::debug("EventLoop fd # {} opened", _baseFd.fd());
}

EventLoop::EventLoop(EventLoop&& rhs) noexcept
    : _nbAllocatedEvents(std::exchange(rhs._nbAllocatedEvents, 0)),
      _pollTimeoutMs(rhs._pollTimeoutMs),
      _baseFd(std::move(rhs._baseFd)),
      _pEvents(std::exchange(rhs._pEvents, nullptr)) {}

EventLoop& EventLoop::operator=(EventLoop&& rhs) noexcept {
  if (this != &rhs) [[likely]] {
    std::free(_pEvents);

    _nbAllocatedEvents = std::exchange(rhs._nbAllocatedEvents, 0);
    _pollTimeoutMs = rhs._pollTimeoutMs;
    _baseFd = std::move(rhs._baseFd);
    _pEvents = std::exchange(rhs._pEvents, nullptr);
  }
  return *this;
}

EventLoop::~EventLoop() { std::free(_pEvents); }

void EventLoop::addOrThrow(EventFd event) const {
  if (!add(event)) [[unlikely]] {
    throw_errno("epoll_ctl ADD failed (fd # {}, events=0x{:x})", event.fd, event.eventBmp);
  }
}

bool EventLoop::add(EventFd event) const {
  epoll_event ev{event.eventBmp, epoll_data_t{.fd = event.fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    log::error("epoll_ctl ADD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
               std::strerror(err));
    errno = err;
    return false;
  }
  return true;
}

bool EventLoop::mod(EventFd event) const {
  epoll_event ev{event.eventBmp, epoll_data_t{.fd = event.fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_MOD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    // EBADF or ENOENT happen when the connection was closed concurrently.
    if (err == EBADF || err == ENOENT) {
      log::warn("epoll_ctl MOD benign failure (fd # {}, errno={}, msg={})", event.fd, err, std::strerror(err));
    } else {
      log::error("epoll_ctl MOD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
                 std::strerror(err));
    }
    return false;
  }
  return true;
}

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) [[unlikely]] {
    const auto err = errno;
    log::debug("epoll_ctl DEL failed (fd # {}, errno={}, msg={})", fd, err, std::strerror(err));
  }
}

std::span<const EventLoop::EventFd> EventLoop::poll() {
  const uint32_t capacityBeforePoll = _nbAllocatedEvents;
  auto* epollEvents = static_cast<epoll_event*>(_pEvents);

  const int nbReadyFds = ::epoll_wait(_baseFd.fd(), epollEvents, static_cast<int>(capacityBeforePoll), _pollTimeoutMs);

  if (nbReadyFds == -1) {
    if (errno == EINTR) {
      return {std::launder(reinterpret_cast<EventFd*>(_pEvents)), 0U};
    }
    const auto err = errno;
    log::error("epoll_wait failed (timeout_ms={}, errno={}, msg={})", _pollTimeoutMs, err, std::strerror(err));
    return {};
  }

  if (std::cmp_equal(nbReadyFds, capacityBeforePoll)) {
    const uint32_t newCapacity = capacityBeforePoll * 2U;
    void* newEvents = std::realloc(_pEvents, static_cast<std::size_t>(newCapacity) * sizeof(epoll_event));
    if (newEvents == nullptr) {
      log::error("Failed to reallocate memory for saturated events, keeping actual size of {}", _nbAllocatedEvents);
    } else {
      _pEvents = newEvents;
      _nbAllocatedEvents = newCapacity;
    }
  }

  // Convert epoll_event[] into EventFd[] in place, front to back (EventFd is not larger than epoll_event).
  epollEvents = static_cast<epoll_event*>(_pEvents);
  EventFd* out = std::launder(reinterpret_cast<EventFd*>(_pEvents));
  for (int idx = 0; idx < nbReadyFds; ++idx) {
    const epoll_event src = epollEvents[idx];
    out[idx] = EventFd{src.data.fd, static_cast<EventBmp>(src.events)};
  }

  return {out, static_cast<std::size_t>(nbReadyFds)};
}

}  // namespace rspd
