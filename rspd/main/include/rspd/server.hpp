#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "rspd/dispatcher.hpp"
#include "rspd/event-fd.hpp"
#include "rspd/event-loop.hpp"
#include "rspd/logging-system.hpp"
#include "rspd/request-context.hpp"
#include "rspd/rsp-interpreter.hpp"
#include "rspd/rustlet-registry.hpp"
#include "rspd/rustlet.hpp"
#include "rspd/server-config.hpp"
#include "rspd/session-store.hpp"
#include "rspd/socket.hpp"
#include "rspd/stats-aggregator.hpp"
#include "rspd/worker.hpp"

namespace rspd {

// The embeddable HTTP engine.
//
// Typical usage:
//   Server server(ServerConfig{}.withBindAddress("127.0.0.1:0").withRootDir("/srv/app"));
//   server.registerRustlet("/echo", [](RequestContext& ctx) { ctx.write(ctx.query()); });
//   server.start();   // non-blocking
//   ...
//   server.stop();
//
// Threads: one acceptor dispatching accepted connections round-robin to 'threadPoolSize' workers, one housekeeping
// thread (session sweep, statistics reports) and the log consumer of the LoggingSystem.
// A Server is single-shot: it cannot be restarted once stopped. It is not thread safe, start() and stop() are meant
// to be called from the same controlling thread.
class Server {
 public:
  explicit Server(ServerConfig config = {});

  Server(const Server&) = delete;
  Server(Server&&) = delete;
  Server& operator=(const Server&) = delete;
  Server& operator=(Server&&) = delete;

  // Stops the server if running.
  ~Server();

  // Registration, allowed before start() only (std::logic_error afterwards). See RustletRegistry.
  void addRustlet(std::string_view name, RustletPtr rustlet) { _registry.addRustlet(name, std::move(rustlet)); }

  template <class Func>
    requires std::invocable<Func&, RequestContext&>
  void addRustlet(std::string_view name, Func&& func) {
    _registry.addRustlet(name, MakeRustlet(std::forward<Func>(func)));
  }

  void addMapping(std::string_view uriPattern, std::string_view name) { _registry.addMapping(uriPattern, name); }

  void registerRustlet(std::string_view uriPattern, RustletPtr rustlet) {
    _registry.registerRustlet(uriPattern, std::move(rustlet));
  }

  template <class Func>
    requires std::invocable<Func&, RequestContext&>
  void registerRustlet(std::string_view uriPattern, Func&& func) {
    _registry.registerRustlet(uriPattern, MakeRustlet(std::forward<Func>(func)));
  }

  // Validates the configuration, opens the logs, binds the listening socket and spawns all threads.
  // Returns once the server accepts connections.
  // Throws std::invalid_argument for a bad configuration, std::system_error if the address cannot be bound,
  // std::logic_error if called twice.
  void start();

  // Stops accepting, closes all connections, joins all threads and flushes the logs. Idempotent.
  void stop();

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }

  // Port actually bound, useful with an ephemeral port. 0 before start().
  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  [[nodiscard]] const ServerConfig& config() const noexcept { return _config; }

  [[nodiscard]] const RustletRegistry& registry() const noexcept { return _registry; }

  [[nodiscard]] SessionStore& sessions() noexcept { return _sessions; }

  [[nodiscard]] StatsAggregator& stats() noexcept { return _stats; }

  // Null before start().
  [[nodiscard]] LoggingSystem* logging() noexcept { return _logging.get(); }

 private:
  void acceptLoop(std::stop_token stopToken);
  void acceptConnections();
  void housekeepingLoop(std::stop_token stopToken);
  void releaseResources() noexcept;

  ServerConfig _config;
  RustletRegistry _registry;
  SessionStore _sessions;
  StatsAggregator _stats;
  RspInterpreter _interpreter;
  Dispatcher _dispatcher;
  std::unique_ptr<LoggingSystem> _logging;

  Socket _listenSocket;
  EventLoop _acceptorLoop;
  EventFd _acceptorWakeup;
  std::vector<std::unique_ptr<Worker>> _workers;
  std::size_t _nextWorker{0};
  uint16_t _port{0};
  bool _started{false};
  std::atomic<bool> _running{false};

  std::mutex _housekeepingMutex;
  std::condition_variable_any _housekeepingCv;

  std::jthread _acceptor;
  std::jthread _housekeeper;
};

}  // namespace rspd
