#include "rspd/async-context.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "rspd/errors.hpp"
#include "rspd/log.hpp"
#include "rspd/request-context.hpp"

namespace rspd {

bool AsyncCompletionQueue::post(std::shared_ptr<RequestContext> context) {
  {
    std::scoped_lock lock(_mutex);
    if (_closed) {
      return false;
    }
    _pending.push_back(std::move(context));
  }
  _wakeup.send();
  return true;
}

void AsyncCompletionQueue::drainTo(std::vector<std::shared_ptr<RequestContext>>& out) {
  std::scoped_lock lock(_mutex);
  if (out.empty()) {
    out.swap(_pending);
  } else {
    out.insert(out.end(), std::make_move_iterator(_pending.begin()), std::make_move_iterator(_pending.end()));
    _pending.clear();
  }
}

void AsyncCompletionQueue::close() noexcept {
  std::vector<std::shared_ptr<RequestContext>> released;
  {
    std::scoped_lock lock(_mutex);
    _closed = true;
    released.swap(_pending);
  }
}

bool AsyncCompletionQueue::isClosed() const {
  std::scoped_lock lock(_mutex);
  return _closed;
}

RequestContext& AsyncContext::request() const {
  if (_state->completed.load(std::memory_order_acquire)) {
    throw ProtocolMisuse("Request accessed through an already completed async context");
  }
  return *_state->context;
}

bool AsyncContext::complete() {
  if (_state->completed.exchange(true, std::memory_order_acq_rel)) {
    log::error("Protocol misuse: complete() called more than once on an async context");
    return false;
  }
  auto context = std::move(_state->context);
  context->_asyncCompleted.store(true, std::memory_order_release);
  const std::string path(context->path());
  if (!_state->completionQueue->post(std::move(context))) {
    log::warn("Async request on '{}' completed after its worker stopped, response dropped", path);
    return false;
  }
  return true;
}

bool AsyncContext::isCompleted() const noexcept { return _state->completed.load(std::memory_order_acquire); }

}  // namespace rspd
