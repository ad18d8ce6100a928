#include "rspd/log-queue.hpp"

#include <cstddef>
#include <iterator>
#include <mutex>
#include <utility>
#include <vector>

#include "rspd/log-entry.hpp"

namespace rspd {

LogQueue::LogQueue(std::size_t capacity) : _capacity(capacity) {}

bool LogQueue::tryPush(LogEntry entry) {
  {
    std::lock_guard lock(_mutex);
    if (_entries.size() < _capacity) {
      _entries.push_back(std::move(entry));
      return true;
    }
  }
  _droppedCount.fetch_add(1, std::memory_order_relaxed);
  return false;
}

std::size_t LogQueue::drainTo(std::vector<LogEntry>& out) {
  std::vector<LogEntry> drained;
  {
    std::lock_guard lock(_mutex);
    drained.swap(_entries);
  }
  const std::size_t nbEntries = drained.size();
  if (out.empty()) {
    out = std::move(drained);
  } else {
    out.insert(out.end(), std::make_move_iterator(drained.begin()), std::make_move_iterator(drained.end()));
  }
  return nbEntries;
}

std::size_t LogQueue::size() const {
  std::lock_guard lock(_mutex);
  return _entries.size();
}

}  // namespace rspd
