#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "rspd/event-fd.hpp"

namespace rspd {

class RequestContext;

// Hands detached requests back to the worker owning their connection.
// A request is posted once by AsyncContext::complete(), and once per RequestContext::flush() before that, the owner
// tells them apart with RequestContext::isAsyncCompleted().
// post() may be called from any thread; the owner waits on wakeFd() in its event loop.
class AsyncCompletionQueue {
 public:
  AsyncCompletionQueue() = default;

  AsyncCompletionQueue(const AsyncCompletionQueue&) = delete;
  AsyncCompletionQueue(AsyncCompletionQueue&&) = delete;
  AsyncCompletionQueue& operator=(const AsyncCompletionQueue&) = delete;
  AsyncCompletionQueue& operator=(AsyncCompletionQueue&&) = delete;

  ~AsyncCompletionQueue() = default;

  // Returns false if the queue has been closed (the owner is gone).
  bool post(std::shared_ptr<RequestContext> context);

  // Appends all posted contexts to 'out' in posting order.
  void drainTo(std::vector<std::shared_ptr<RequestContext>>& out);

  // Rejects further posts and releases the pending contexts.
  void close() noexcept;

  [[nodiscard]] bool isClosed() const;

  [[nodiscard]] int wakeFd() const noexcept { return _wakeup.fd(); }

  void consumeWakeup() const noexcept { _wakeup.read(); }

 private:
  mutable std::mutex _mutex;
  std::vector<std::shared_ptr<RequestContext>> _pending;
  bool _closed{false};
  EventFd _wakeup;
};

// Handle on a request detached from its worker by RequestContext::startAsync().
//
// Copies share the same state, so the handle may be moved or copied to any thread.
// complete() must be called exactly once: it gives the request back to its worker which then flushes the response.
class AsyncContext {
 public:
  // The detached request. Throws ProtocolMisuse once complete() has been called.
  [[nodiscard]] RequestContext& request() const;

  // Hands the request back to its worker.
  // Returns false (and logs a protocol misuse) if already completed, or if the owning worker is gone.
  bool complete();

  [[nodiscard]] bool isCompleted() const noexcept;

 private:
  friend class RequestContext;

  struct State {
    std::shared_ptr<RequestContext> context;
    std::shared_ptr<AsyncCompletionQueue> completionQueue;
    std::atomic<bool> completed{false};
  };

  explicit AsyncContext(std::shared_ptr<State> state) noexcept : _state(std::move(state)) {}

  std::shared_ptr<State> _state;
};

}  // namespace rspd
