#include "rspd/server.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "rspd/connection.hpp"
#include "rspd/event.hpp"
#include "rspd/event-loop.hpp"
#include "rspd/log.hpp"
#include "rspd/logging-system.hpp"
#include "rspd/server-config.hpp"
#include "rspd/socket.hpp"
#include "rspd/timedef.hpp"
#include "rspd/worker.hpp"

namespace rspd {

namespace {

std::string PageRoot(const ServerConfig& config) {
  std::filesystem::path webroot(config.webroot);
  if (webroot.is_relative()) {
    webroot = std::filesystem::path(config.rootDir) / webroot;
  }
  return webroot.string();
}

}  // namespace

Server::Server(ServerConfig config)
    : _config(std::move(config)),
      _sessions(_config.sessionTimeout),
      _interpreter(_registry, _config.rspCache),
      _dispatcher(_registry, _interpreter, PageRoot(_config)) {}

Server::~Server() { stop(); }

void Server::start() {
  if (_started) {
    throw std::logic_error("Server can only be started once");
  }
  _config.validate();
  _started = true;

  _logging = std::make_unique<LoggingSystem>(_config);

  try {
    const std::string configStr = _config.logConfigString();
    for (std::string_view remaining(configStr); !remaining.empty();) {
      const auto eol = remaining.find('\n');
      const std::string_view line = remaining.substr(0, eol);
      if (!line.empty()) {
        log::info("{}", line);
      }
      remaining.remove_prefix(eol == std::string_view::npos ? remaining.size() : eol + 1);
    }

    _registry.freeze();

    uint16_t port = _config.bindPort();
    _listenSocket = Socket(Socket::Type::StreamNonBlock);
    _listenSocket.bindAndListen(_config.bindHost(), port);
    _port = port;

    _acceptorLoop = EventLoop(_config.pollInterval);
    _acceptorLoop.addOrThrow(EventLoop::EventFd{_listenSocket.fd(), EventIn});
    _acceptorLoop.addOrThrow(EventLoop::EventFd{_acceptorWakeup.fd(), EventIn});

    _workers.reserve(_config.threadPoolSize);
    for (uint32_t workerId = 0; workerId < _config.threadPoolSize; ++workerId) {
      _workers.push_back(std::make_unique<Worker>(workerId, _config, _dispatcher, _sessions, _stats, *_logging));
    }
    for (auto& worker : _workers) {
      worker->start();
    }

    _acceptor = std::jthread([this](std::stop_token stopToken) { acceptLoop(std::move(stopToken)); });
    _housekeeper = std::jthread([this](std::stop_token stopToken) { housekeepingLoop(std::move(stopToken)); });
  } catch (const std::exception& ex) {
    log::critical("Unable to start server: {}", ex.what());
    releaseResources();
    throw;
  }

  _running.store(true, std::memory_order_release);
  log::info("Server started on {}:{} with {} worker(s), serving pages from '{}'", _config.bindHost(), _port,
            _workers.size(), _dispatcher.pageRoot());
  _logging->markStarted();
}

void Server::stop() {
  if (!_running.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  log::info("Stopping server on port {}", _port);
  releaseResources();
}

void Server::releaseResources() noexcept {
  if (_acceptor.joinable()) {
    _acceptor.request_stop();
    _acceptorWakeup.send();
    _acceptor.join();
  }
  _listenSocket.close();

  for (auto& worker : _workers) {
    worker->stop();
  }
  _workers.clear();

  if (_housekeeper.joinable()) {
    _housekeeper.request_stop();
    _housekeepingCv.notify_all();
    _housekeeper.join();
  }

  if (_logging) {
    log::info("Server stopped after serving {} request(s)", _stats.cumulative(SysClock::now()).requests);
    _logging->shutdown();
  }
}

void Server::acceptLoop(std::stop_token stopToken) {
  log::debug("Acceptor thread started");
  while (!stopToken.stop_requested()) {
    const auto events = _acceptorLoop.poll();
    if (events.data() == nullptr) {
      // failure already logged, avoid a busy loop
      std::this_thread::sleep_for(_config.pollInterval);
      continue;
    }
    for (const auto& event : events) {
      if (event.fd == _acceptorWakeup.fd()) {
        _acceptorWakeup.read();
      } else if (event.fd == _listenSocket.fd()) {
        acceptConnections();
      }
    }
  }
  log::debug("Acceptor thread stopped");
}

void Server::acceptConnections() {
  while (true) {
    Connection cnx(_listenSocket);
    if (!cnx) {
      break;
    }
    Worker& worker = *_workers[_nextWorker];
    _nextWorker = (_nextWorker + 1) % _workers.size();
    log::trace("Connection fd # {} handed to worker {}", cnx.fd(), worker.id());
    worker.submit(std::move(cnx));
  }
}

void Server::housekeepingLoop(std::stop_token stopToken) {
  auto nextSweep = SteadyClock::now() + _config.sessionSweepInterval;
  auto nextStats = SteadyClock::now() + _config.statsFrequency;
  while (!stopToken.stop_requested()) {
    {
      std::unique_lock lock(_housekeepingMutex);
      _housekeepingCv.wait_until(lock, stopToken, std::min(nextSweep, nextStats), [] { return false; });
    }
    if (stopToken.stop_requested()) {
      break;
    }
    const auto now = SteadyClock::now();
    try {
      if (now >= nextSweep) {
        const std::size_t nbSwept = _sessions.sweep(now);
        if (nbSwept != 0) {
          log::debug("Swept {} expired session(s), {} remaining", nbSwept, _sessions.size());
        }
        nextSweep = now + _config.sessionSweepInterval;
      }
      if (now >= nextStats) {
        if (!_logging->logStats(_stats.snapshot(SysClock::now()))) {
          log::warn("Statistics report dropped, log queue is full");
        }
        nextStats = now + _config.statsFrequency;
      }
    } catch (const std::exception& ex) {
      log::error("Housekeeping failure: {}", ex.what());
    }
  }
}

}  // namespace rspd
