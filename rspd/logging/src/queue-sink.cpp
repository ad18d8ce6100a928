#include "rspd/queue-sink.hpp"

#include <spdlog/details/log_msg.h>

#include <chrono>
#include <string>
#include <utility>

#include "rspd/log-entry.hpp"
#include "rspd/timedef.hpp"

namespace rspd {

void QueueSink::sink_it_(const spdlog::details::log_msg& msg) {
  MainEvent event{msg.level, std::chrono::time_point_cast<SysDuration>(msg.time),
                  std::string(msg.payload.data(), msg.payload.size())};
  (void)_queue->tryPush(std::move(event));
}

}  // namespace rspd
