#pragma once

#include <spdlog/details/log_msg.h>
#include <spdlog/details/null_mutex.h>
#include <spdlog/sinks/base_sink.h>

#include <memory>
#include <utility>

#include "rspd/log-queue.hpp"

namespace rspd {

// spdlog sink turning each message into a MainEvent pushed to the log queue.
// Never blocks: messages are dropped (and counted by the queue) when it is full.
// The queue is shared as the logger may outlive its LoggingSystem while still installed somewhere.
class QueueSink final : public spdlog::sinks::base_sink<spdlog::details::null_mutex> {
 public:
  explicit QueueSink(std::shared_ptr<LogQueue> queue) noexcept : _queue(std::move(queue)) {}

 protected:
  void sink_it_(const spdlog::details::log_msg& msg) override;
  void flush_() override {}

 private:
  std::shared_ptr<LogQueue> _queue;
};

}  // namespace rspd
