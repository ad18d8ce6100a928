#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "rspd/async-context.hpp"
#include "rspd/connection.hpp"
#include "rspd/dispatcher.hpp"
#include "rspd/event-fd.hpp"
#include "rspd/event-loop.hpp"
#include "rspd/logging-system.hpp"
#include "rspd/request-context.hpp"
#include "rspd/server-config.hpp"
#include "rspd/session-store.hpp"
#include "rspd/stats-aggregator.hpp"
#include "rspd/timedef.hpp"
#include "rspd/timer-fd.hpp"

namespace rspd {

// One thread of the worker pool, owning its own epoll loop and the connections submitted to it.
//
// All reads and writes of a connection happen on its worker thread. Requests are parsed and dispatched
// synchronously; a request detached with startAsync() is handed back through the completion queue, after which its
// response is flushed and the connection resumes reading.
class Worker {
 public:
  Worker(uint32_t id, const ServerConfig& config, const Dispatcher& dispatcher, SessionStore& sessions,
         StatsAggregator& stats, LoggingSystem& logging);

  Worker(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker& operator=(Worker&&) = delete;

  ~Worker();

  // Spawns the worker thread.
  void start();

  // Stops the thread and closes all its connections. Idempotent.
  void stop();

  // Hands an accepted connection to this worker. Thread safe.
  void submit(Connection cnx);

  [[nodiscard]] uint32_t id() const noexcept { return _id; }

 private:
  struct ConnectionState {
    explicit ConnectionState(Connection cnx, SteadyTimePoint now) noexcept
        : connection(std::move(cnx)), acceptedAt(now), lastActivity(now) {}

    Connection connection;
    std::string inBuffer;
    std::string outBuffer;
    SteadyTimePoint acceptedAt;
    SteadyTimePoint lastActivity;
    // Request detached by startAsync(), waiting for AsyncContext::complete().
    std::shared_ptr<RequestContext> asyncRequest;
    SteadyTimePoint asyncStart;
    uint64_t nbRequests{0};
    bool waitingWritable{false};
    // Close once the pending response has been flushed.
    bool closeAfterFlush{false};
    // Peer closed or failed while the request was detached.
    bool closeRequested{false};
  };

  using ConnectionMap = std::unordered_map<int, std::unique_ptr<ConnectionState>>;
  using ConnectionMapIt = ConnectionMap::iterator;

  void run(std::stop_token stopToken);
  void eventLoopIteration();
  void adoptSubmittedConnections();
  void handleCompletions();
  void handleReadable(int fd);
  void handleWritable(int fd);

  enum class ReadStatus : uint8_t { Drained, Capped, PeerClosed, Error };

  ReadStatus readAvailable(ConnectionState& state);
  void processInput(ConnectionState& state);
  void finishRequest(ConnectionState& state, RequestContext& ctx);
  // Sends the output flushed by a request still in progress.
  void sendFlushedOutput(RequestContext& ctx);

  // Returns false if a write error occurred.
  bool flushOutbound(ConnectionState& state);

  // Closes the connection if it is done, otherwise keeps it.
  void closeIfDone(ConnectionMapIt cnxIt);
  ConnectionMapIt closeConnection(ConnectionMapIt cnxIt);
  void closeAllConnections();
  void sweepConnections();
  void updateInterest(ConnectionState& state);

  uint32_t _id;
  const ServerConfig& _config;
  const Dispatcher& _dispatcher;
  SessionStore& _sessions;
  StatsAggregator& _stats;
  LoggingSystem& _logging;

  EventLoop _eventLoop;
  EventFd _wakeup;
  TimerFd _maintenanceTimer;
  std::shared_ptr<AsyncCompletionQueue> _completions;
  ConnectionMap _connections;
  std::vector<std::shared_ptr<RequestContext>> _completedRequests;

  std::mutex _inboxMutex;
  std::vector<Connection> _inbox;

  // Stop token of the running thread, only used by it.
  std::stop_token _stopToken;
  std::jthread _thread;
};

}  // namespace rspd
