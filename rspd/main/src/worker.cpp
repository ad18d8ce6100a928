#include "rspd/worker.hpp"

#include <sys/socket.h>
#include <sys/types.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include "rspd/connection.hpp"
#include "rspd/event.hpp"
#include "rspd/http-constants.hpp"
#include "rspd/http-method.hpp"
#include "rspd/http-status-code.hpp"
#include "rspd/log-entry.hpp"
#include "rspd/log.hpp"
#include "rspd/request-context.hpp"
#include "rspd/request-parser.hpp"
#include "rspd/response-writer.hpp"
#include "rspd/socket-ops.hpp"
#include "rspd/timedef.hpp"

namespace rspd {

namespace {

constexpr EventBmp kReadEvents = EventIn | EventRdHup | EventEt;
constexpr EventBmp kDetachedEvents = EventRdHup | EventEt;

constexpr std::size_t kReadChunkBytes = 4096;

// Period of the maintenance timer: the smallest enabled timeout, bounded by the poll interval.
SysDuration MaintenanceInterval(const ServerConfig& config) {
  using std::chrono::milliseconds;

  milliseconds interval = config.pollInterval;
  const auto consider = [&interval](milliseconds dur) {
    if (dur.count() > 0) {
      interval = std::min(interval, dur);
    }
  };
  consider(config.idleTimeout);
  consider(config.requestTimeout);
  consider(config.asyncTimeout);
  return interval;
}

}  // namespace

Worker::Worker(uint32_t id, const ServerConfig& config, const Dispatcher& dispatcher, SessionStore& sessions,
               StatsAggregator& stats, LoggingSystem& logging)
    : _id(id),
      _config(config),
      _dispatcher(dispatcher),
      _sessions(sessions),
      _stats(stats),
      _logging(logging),
      _eventLoop(config.pollInterval),
      _completions(std::make_shared<AsyncCompletionQueue>()) {
  _eventLoop.addOrThrow(EventLoop::EventFd{_wakeup.fd(), EventIn});
  _eventLoop.addOrThrow(EventLoop::EventFd{_maintenanceTimer.fd(), EventIn});
  _eventLoop.addOrThrow(EventLoop::EventFd{_completions->wakeFd(), EventIn});
  _maintenanceTimer.armPeriodic(MaintenanceInterval(config));
}

Worker::~Worker() { stop(); }

void Worker::start() {
  _thread = std::jthread([this](std::stop_token stopToken) { run(std::move(stopToken)); });
}

void Worker::stop() {
  if (_thread.joinable()) {
    _thread.request_stop();
    _wakeup.send();
    _thread.join();
  }
}

void Worker::submit(Connection cnx) {
  {
    std::scoped_lock lock(_inboxMutex);
    _inbox.push_back(std::move(cnx));
  }
  _wakeup.send();
}

void Worker::run(std::stop_token stopToken) {
  log::debug("Worker {} started", _id);
  _stopToken = std::move(stopToken);
  while (!_stopToken.stop_requested()) {
    try {
      eventLoopIteration();
    } catch (const std::exception& ex) {
      log::error("Worker {} event loop error: {}", _id, ex.what());
    }
  }
  _completions->close();
  closeAllConnections();
  log::debug("Worker {} stopped", _id);
}

void Worker::eventLoopIteration() {
  const auto events = _eventLoop.poll();
  if (events.data() == nullptr) [[unlikely]] {
    log::error("Worker {} failed to poll its event loop", _id);
    return;
  }
  bool adoptSubmitted = false;
  for (const auto event : events) {
    const int fd = event.fd;
    if (fd == _wakeup.fd()) {
      _wakeup.read();
      adoptSubmitted = true;
    } else if (fd == _completions->wakeFd()) {
      _completions->consumeWakeup();
      handleCompletions();
    } else if (fd == _maintenanceTimer.fd()) {
      _maintenanceTimer.drain();
      sweepConnections();
    } else {
      const auto bmp = event.eventBmp;
      if ((bmp & EventOut) != 0) {
        handleWritable(fd);
      }
      // EPOLLERR/EPOLLHUP/EPOLLRDHUP can be delivered without EPOLLIN.
      if ((bmp & (EventIn | EventErr | EventHup | EventRdHup)) != 0) {
        handleReadable(fd);
      }
    }
  }
  // Once the batch is handled: a descriptor closed in it may be reused by a submitted connection, which must not
  // receive the events gathered for the closed one.
  if (adoptSubmitted) {
    adoptSubmittedConnections();
  }
}

void Worker::adoptSubmittedConnections() {
  std::vector<Connection> submitted;
  {
    std::scoped_lock lock(_inboxMutex);
    submitted.swap(_inbox);
  }
  const auto now = SteadyClock::now();
  for (Connection& cnx : submitted) {
    const int fd = cnx.fd();
    if (!SetTcpNoDelay(fd)) {
      log::debug("Unable to set TCP_NODELAY on fd # {}", fd);
    }
    if (!_eventLoop.add(EventLoop::EventFd{fd, kReadEvents})) {
      // 'cnx' is closed when 'submitted' goes out of scope.
      continue;
    }
    _stats.onConnect();
    _connections.insert_or_assign(fd, std::make_unique<ConnectionState>(std::move(cnx), now));
  }
}

Worker::ReadStatus Worker::readAvailable(ConnectionState& state) {
  const int fd = state.connection.fd();
  const std::size_t maxBuffered = _config.maxHeaderBytes + _config.maxBodyBytes;
  for (;;) {
    if (state.inBuffer.size() > maxBuffered) {
      return ReadStatus::Capped;
    }
    const std::size_t oldSize = state.inBuffer.size();
    ssize_t nbRead = 0;
    state.inBuffer.resize_and_overwrite(oldSize + kReadChunkBytes, [fd, oldSize, &nbRead](char* data, std::size_t) {
      nbRead = ::recv(fd, data + oldSize, kReadChunkBytes, 0);
      return nbRead > 0 ? oldSize + static_cast<std::size_t>(nbRead) : oldSize;
    });
    if (nbRead > 0) {
      state.lastActivity = SteadyClock::now();
      continue;
    }
    if (nbRead == 0) {
      return ReadStatus::PeerClosed;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return ReadStatus::Drained;
    }
    log::debug("recv failed on fd # {}: {}", fd, std::strerror(errno));
    return ReadStatus::Error;
  }
}

void Worker::processInput(ConnectionState& state) {
  while (!state.asyncRequest && !state.closeAfterFlush && !state.inBuffer.empty()) {
    auto res = ParseRequest(state.inBuffer, _config.maxHeaderBytes, _config.maxBodyBytes);
    if (res.status == RequestParseResult::Status::NeedMore) {
      break;
    }
    if (res.status == RequestParseResult::Status::Error) {
      log::debug("Invalid request on fd # {}, answering {}", state.connection.fd(), res.errorStatus);
      AppendErrorResponse(state.outBuffer, res.errorStatus, _config.serverName, SysClock::now());
      state.closeAfterFlush = true;
      state.inBuffer.clear();
      break;
    }
    state.inBuffer.erase(0, res.consumed);
    ++state.nbRequests;

    RequestContext& ctx = *res.request;
    ctx.bindWorker(state.connection.fd(), &_sessions, _completions, _config.serverName,
                   [this](RequestContext& flushed) { sendFlushedOutput(flushed); });
    _dispatcher.dispatch(ctx);
    if (ctx.isAsync()) {
      state.asyncRequest = std::move(res.request);
      state.asyncStart = SteadyClock::now();
      updateInterest(state);
      break;
    }
    finishRequest(state, ctx);
  }
}

void Worker::finishRequest(ConnectionState& state, RequestContext& ctx) {
  const bool keepAlive = ctx.keepAlive() && !state.closeRequested && !_stopToken.stop_requested();
  if (ctx.isStreaming()) {
    ctx.takeFlushedOutput(state.outBuffer);
    if (!ctx.streamFailed() && ctx.method() != http::Method::HEAD) {
      // Body written after the last flush.
      AppendStreamData(state.outBuffer, ctx.responseBody(), ctx.isChunked());
      if (ctx.isChunked()) {
        AppendStreamEnd(state.outBuffer);
      }
    }
  } else {
    AppendResponse(state.outBuffer, ctx, _config.serverName, SysClock::now(), keepAlive);
  }
  if (!keepAlive) {
    state.closeAfterFlush = true;
  }

  const auto now = SteadyClock::now();
  state.lastActivity = now;
  const auto procTime = std::chrono::duration_cast<std::chrono::microseconds>(now - ctx.startTime());
  _stats.onRequest(procTime);
  _logging.logRequest(RequestEvent{ctx.receivedAt(), std::string(ctx.methodStr()), std::string(ctx.path()),
                                   std::string(ctx.query()), std::string(ctx.headerOrEmpty(http::UserAgent)),
                                   std::string(ctx.headerOrEmpty(http::Referer)), procTime});
}

void Worker::sendFlushedOutput(RequestContext& ctx) {
  const auto cnxIt = _connections.find(ctx.connectionFd());
  if (cnxIt == _connections.end()) {
    return;
  }
  ConnectionState& state = *cnxIt->second;
  ctx.takeFlushedOutput(state.outBuffer);
  if (!flushOutbound(state)) {
    state.closeRequested = true;
  }
}

bool Worker::flushOutbound(ConnectionState& state) {
  const int fd = state.connection.fd();
  std::string& out = state.outBuffer;
  std::size_t offset = 0;
  bool ok = true;
  while (offset < out.size()) {
    const auto nbSent = SafeSend(fd, out.data() + offset, out.size() - offset);
    if (nbSent > 0) {
      offset += static_cast<std::size_t>(nbSent);
      continue;
    }
    if (nbSent < 0 && errno == EINTR) {
      continue;
    }
    if (nbSent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      break;
    }
    log::debug("send failed on fd # {}: {}", fd, std::strerror(errno));
    ok = false;
    break;
  }
  out.erase(0, offset);

  const bool wantWritable = ok && !out.empty();
  if (wantWritable != state.waitingWritable) {
    state.waitingWritable = wantWritable;
    updateInterest(state);
  }
  return ok;
}

void Worker::updateInterest(ConnectionState& state) {
  EventBmp bmp = state.asyncRequest ? kDetachedEvents : kReadEvents;
  if (state.waitingWritable) {
    bmp |= EventOut;
  }
  if (!_eventLoop.mod(EventLoop::EventFd{state.connection.fd(), bmp})) {
    state.closeRequested = true;
  }
}

void Worker::handleReadable(int fd) {
  const auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    return;
  }
  ConnectionState& state = *cnxIt->second;
  if (state.asyncRequest) {
    // Only hang-ups are reported while detached. Closing is deferred until the request completes.
    state.closeRequested = true;
    return;
  }

  ReadStatus status;
  do {
    status = readAvailable(state);
    processInput(state);
  } while (status == ReadStatus::Capped && !state.asyncRequest && !state.closeAfterFlush);

  if (status == ReadStatus::Error) {
    closeConnection(cnxIt);
    return;
  }
  if (status == ReadStatus::PeerClosed) {
    state.closeRequested = true;
  }
  if (!flushOutbound(state)) {
    closeConnection(cnxIt);
    return;
  }
  closeIfDone(cnxIt);
}

void Worker::handleWritable(int fd) {
  const auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    return;
  }
  if (!flushOutbound(*cnxIt->second)) {
    closeConnection(cnxIt);
    return;
  }
  closeIfDone(cnxIt);
}

void Worker::handleCompletions() {
  _completions->drainTo(_completedRequests);
  for (const auto& ctx : _completedRequests) {
    const int fd = ctx->connectionFd();
    const auto cnxIt = _connections.find(fd);
    if (cnxIt == _connections.end() || cnxIt->second->asyncRequest != ctx) {
      log::debug("Dropping async output of '{}', its request is finished or its connection closed", ctx->path());
      continue;
    }
    ConnectionState& state = *cnxIt->second;
    if (!ctx->isAsyncCompleted()) {
      // Partial output flushed by the detached request.
      ctx->takeFlushedOutput(state.outBuffer);
      if (!flushOutbound(state)) {
        closeConnection(cnxIt);
      }
      continue;
    }
    state.asyncRequest.reset();
    finishRequest(state, *ctx);
    updateInterest(state);
    if (!flushOutbound(state)) {
      closeConnection(cnxIt);
      continue;
    }
    if (state.closeAfterFlush || state.closeRequested) {
      closeIfDone(cnxIt);
      continue;
    }
    // Resume with pipelined requests and data received while detached.
    handleReadable(fd);
  }
  _completedRequests.clear();
}

void Worker::closeIfDone(ConnectionMapIt cnxIt) {
  const ConnectionState& state = *cnxIt->second;
  if (state.asyncRequest) {
    return;
  }
  if (state.outBuffer.empty() && (state.closeAfterFlush || state.closeRequested)) {
    closeConnection(cnxIt);
  }
}

Worker::ConnectionMapIt Worker::closeConnection(ConnectionMapIt cnxIt) {
  _eventLoop.del(cnxIt->first);
  _stats.onDisconnect();
  return _connections.erase(cnxIt);
}

void Worker::closeAllConnections() {
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    cnxIt = closeConnection(cnxIt);
  }
}

void Worker::sweepConnections() {
  const auto now = SteadyClock::now();
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    ConnectionState& state = *cnxIt->second;
    if (state.asyncRequest) {
      if (_config.asyncTimeout.count() > 0 && now - state.asyncStart > _config.asyncTimeout) {
        log::error("Protocol misuse: async request '{}' not completed within {} ms, closing its connection",
                   state.asyncRequest->path(), _config.asyncTimeout.count());
        cnxIt = closeConnection(cnxIt);
        continue;
      }
    } else if (state.nbRequests == 0) {
      if (now - state.acceptedAt > _config.requestTimeout) {
        _stats.onRequestTimeout();
        std::string out;
        AppendErrorResponse(out, http::StatusCodeRequestTimeout, _config.serverName, SysClock::now());
        if (SafeSend(state.connection.fd(), out) < 0) {
          log::debug("Unable to send request timeout response on fd # {}", cnxIt->first);
        }
        cnxIt = closeConnection(cnxIt);
        continue;
      }
    } else if (now - state.lastActivity > _config.idleTimeout) {
      _stats.onIdleDisconnect();
      cnxIt = closeConnection(cnxIt);
      continue;
    }
    ++cnxIt;
  }
}

}  // namespace rspd
