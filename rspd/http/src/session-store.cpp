#include "rspd/session-store.hpp"

#include <openssl/rand.h>

#include <array>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>

#include "rspd/char-hexadecimal-converter.hpp"
#include "rspd/log.hpp"
#include "rspd/request-context.hpp"
#include "rspd/timedef.hpp"

namespace rspd {

std::optional<std::string> SessionHandle::get(std::string_view key) const {
  if (_session == nullptr) {
    return std::nullopt;
  }
  return _store->read(*this, key);
}

void SessionHandle::set(std::string_view key, std::string_view value) const {
  if (_session != nullptr) {
    _store->write(*this, key, value);
  }
}

bool SessionHandle::erase(std::string_view key) const { return _session != nullptr && _store->erase(*this, key); }

void SessionHandle::invalidate() const {
  if (_session != nullptr) {
    _store->invalidate(*this);
  }
}

std::string_view SessionHandle::id() const noexcept {
  return _session == nullptr ? std::string_view{} : std::string_view(_session->id);
}

bool SessionHandle::isLive() const {
  if (_session == nullptr) {
    return false;
  }
  std::scoped_lock lock(_session->mutex);
  return !_session->evicted;
}

SessionHandle SessionStore::getOrCreate(RequestContext& ctx, SteadyTimePoint now) {
  const auto cookieValue = ctx.cookie(kSessionCookieName);
  if (cookieValue) {
    std::shared_ptr<Session> session;
    {
      std::shared_lock lock(_mutex);
      auto it = _sessions.find(std::string(*cookieValue));
      if (it != _sessions.end()) {
        session = it->second;
      }
    }
    if (session) {
      std::scoped_lock lock(session->mutex);
      if (!session->evicted && !isExpired(*session, now)) {
        session->lastAccess = now;
        return {std::move(session), this};
      }
    }
  }

  auto session = std::make_shared<Session>(GenerateId(), now);
  {
    std::unique_lock lock(_mutex);
    while (!_sessions.emplace(session->id, session).second) {
      session = std::make_shared<Session>(GenerateId(), now);
    }
  }
  ctx.setCookie(kSessionCookieName, session->id);
  log::debug("New session {}", session->id);
  return {std::move(session), this};
}

std::optional<std::string> SessionStore::read(const SessionHandle& handle, std::string_view key,
                                              SteadyTimePoint now) const {
  Session& session = *handle._session;
  std::scoped_lock lock(session.mutex);
  if (session.evicted) {
    return std::nullopt;
  }
  session.lastAccess = now;
  auto it = session.values.find(std::string(key));
  if (it == session.values.end()) {
    return std::nullopt;
  }
  return it->second;
}

void SessionStore::write(const SessionHandle& handle, std::string_view key, std::string_view value,
                         SteadyTimePoint now) const {
  Session& session = *handle._session;
  std::scoped_lock lock(session.mutex);
  if (session.evicted) {
    log::debug("Write of '{}' to dead session {} ignored", key, session.id);
    return;
  }
  session.lastAccess = now;
  session.values.insert_or_assign(std::string(key), std::string(value));
}

bool SessionStore::erase(const SessionHandle& handle, std::string_view key, SteadyTimePoint now) const {
  Session& session = *handle._session;
  std::scoped_lock lock(session.mutex);
  if (session.evicted) {
    return false;
  }
  session.lastAccess = now;
  return session.values.erase(std::string(key)) != 0;
}

void SessionStore::invalidate(const SessionHandle& handle) {
  Session& session = *handle._session;
  std::unique_lock lock(_mutex);
  auto it = _sessions.find(session.id);
  if (it != _sessions.end() && it->second.get() == &session) {
    _sessions.erase(it);
  }
  std::scoped_lock sessionLock(session.mutex);
  session.evicted = true;
  session.values.clear();
}

std::size_t SessionStore::sweep(SteadyTimePoint now) {
  std::size_t nbEvicted = 0;
  std::unique_lock lock(_mutex);
  for (auto it = _sessions.begin(); it != _sessions.end();) {
    const std::shared_ptr<Session> session = it->second;
    std::scoped_lock sessionLock(session->mutex);
    if (isExpired(*session, now)) {
      session->evicted = true;
      session->values.clear();
      it = _sessions.erase(it);
      ++nbEvicted;
    } else {
      ++it;
    }
  }
  if (nbEvicted != 0) {
    log::debug("Evicted {} idle session(s), {} remaining", nbEvicted, _sessions.size());
  }
  return nbEvicted;
}

std::size_t SessionStore::size() const {
  std::shared_lock lock(_mutex);
  return _sessions.size();
}

std::string SessionStore::GenerateId() {
  static constexpr std::size_t kNbIdBytes = 16;

  std::array<unsigned char, kNbIdBytes> bytes;
  if (::RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed generating session id");
  }

  std::string id(kNbIdBytes * 2U, '\0');
  char* out = id.data();
  for (unsigned char byte : bytes) {
    out = to_lower_hex(byte, out);
  }
  return id;
}

}  // namespace rspd
