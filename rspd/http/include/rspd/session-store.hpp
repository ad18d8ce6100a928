#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "rspd/timedef.hpp"

namespace rspd {

class RequestContext;
class SessionStore;

inline constexpr std::string_view kSessionCookieName = "rspdsessionid";

// Server-side state of one client session.
// All members but the id are guarded by 'mutex'.
struct Session {
  explicit Session(std::string sessionId, SteadyTimePoint now) : id(std::move(sessionId)), lastAccess(now) {}

  const std::string id;
  std::mutex mutex;
  std::unordered_map<std::string, std::string> values;
  SteadyTimePoint lastAccess;
  // Set under 'mutex' when the session is removed from the store. A dead session is never revived.
  bool evicted{false};
};

// Reference on a session, obtained from SessionStore::getOrCreate() or RequestContext::session().
// Operations on a session evicted in the meantime are no-ops.
class SessionHandle {
 public:
  SessionHandle() noexcept = default;

  [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

  void set(std::string_view key, std::string_view value) const;

  // Returns true if the key existed.
  bool erase(std::string_view key) const;

  void invalidate() const;

  [[nodiscard]] std::string_view id() const noexcept;

  // False for a default constructed handle or once the session has been evicted or invalidated.
  [[nodiscard]] bool isLive() const;

  explicit operator bool() const noexcept { return _session != nullptr; }

 private:
  friend class SessionStore;

  SessionHandle(std::shared_ptr<Session> session, SessionStore* store) noexcept
      : _session(std::move(session)), _store(store) {}

  std::shared_ptr<Session> _session;
  SessionStore* _store{nullptr};
};

// Per-client key/value maps keyed by an opaque, unpredictable session id carried in the 'rspdsessionid' cookie.
//
// The map of sessions is guarded by a reader/writer lock, each session by its own mutex.
// Sessions not accessed for longer than the timeout are removed by sweep(), called periodically by a housekeeping
// thread.
class SessionStore {
 public:
  explicit SessionStore(std::chrono::milliseconds timeout) : _timeout(timeout) {}

  SessionStore(const SessionStore&) = delete;
  SessionStore(SessionStore&&) = delete;
  SessionStore& operator=(const SessionStore&) = delete;
  SessionStore& operator=(SessionStore&&) = delete;

  ~SessionStore() = default;

  // Returns the live session designated by the request cookie and refreshes it, or creates a new one.
  // On creation, 'Set-Cookie: rspdsessionid=<id>; path=/' is added to the response.
  SessionHandle getOrCreate(RequestContext& ctx, SteadyTimePoint now = SteadyClock::now());

  [[nodiscard]] std::optional<std::string> read(const SessionHandle& handle, std::string_view key,
                                                SteadyTimePoint now = SteadyClock::now()) const;

  void write(const SessionHandle& handle, std::string_view key, std::string_view value,
             SteadyTimePoint now = SteadyClock::now()) const;

  bool erase(const SessionHandle& handle, std::string_view key, SteadyTimePoint now = SteadyClock::now()) const;

  void invalidate(const SessionHandle& handle);

  // Evicts all sessions whose last access is older than the timeout. Returns the number of evicted sessions.
  std::size_t sweep(SteadyTimePoint now = SteadyClock::now());

  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return _timeout; }

 private:
  [[nodiscard]] bool isExpired(const Session& session, SteadyTimePoint now) const noexcept {
    return now - session.lastAccess > _timeout;
  }

  static std::string GenerateId();

  mutable std::shared_mutex _mutex;
  std::unordered_map<std::string, std::shared_ptr<Session>> _sessions;
  std::chrono::milliseconds _timeout;
};

}  // namespace rspd
