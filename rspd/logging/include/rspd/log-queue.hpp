#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

#include "rspd/log-entry.hpp"

namespace rspd {

// Bounded FIFO of log entries shared by many producers and one consumer.
// Producers never block on a full queue: the entry is dropped and counted instead.
class LogQueue {
 public:
  explicit LogQueue(std::size_t capacity);

  // Returns false, and increments the drop counter, if the queue is at capacity.
  [[nodiscard]] bool tryPush(LogEntry entry);

  // Appends all queued entries to 'out' in FIFO order and empties the queue.
  // Returns the number of entries moved.
  std::size_t drainTo(std::vector<LogEntry>& out);

  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] std::size_t capacity() const noexcept { return _capacity; }

  [[nodiscard]] uint64_t droppedCount() const noexcept { return _droppedCount.load(std::memory_order_relaxed); }

 private:
  mutable std::mutex _mutex;
  std::vector<LogEntry> _entries;
  std::size_t _capacity;
  std::atomic<uint64_t> _droppedCount{0};
};

}  // namespace rspd
