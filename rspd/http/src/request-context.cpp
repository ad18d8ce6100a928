#include "rspd/request-context.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "rspd/async-context.hpp"
#include "rspd/errors.hpp"
#include "rspd/http-constants.hpp"
#include "rspd/http-method.hpp"
#include "rspd/http-status-code.hpp"
#include "rspd/log.hpp"
#include "rspd/response-writer.hpp"
#include "rspd/session-store.hpp"
#include "rspd/string-equal-ignore-case.hpp"
#include "rspd/string-trim.hpp"
#include "rspd/timedef.hpp"
#include "rspd/url-decode.hpp"

namespace rspd {

namespace {

// Parses 'name1=value1; name2=value2' into 'out'. Entries without a name are skipped.
void ParseCookieHeader(std::string_view value, RequestContext::Cookies& out) {
  while (!value.empty()) {
    const auto semicolonPos = value.find(';');
    std::string_view pair = TrimOws(value.substr(0, semicolonPos));
    value = semicolonPos == std::string_view::npos ? std::string_view{} : value.substr(semicolonPos + 1);

    const auto equalPos = pair.find('=');
    const std::string_view name = TrimOws(pair.substr(0, equalPos));
    if (name.empty()) {
      continue;
    }
    std::string_view cookieValue;
    if (equalPos != std::string_view::npos) {
      cookieValue = TrimOws(pair.substr(equalPos + 1));
      if (cookieValue.size() >= 2 && cookieValue.front() == '"' && cookieValue.back() == '"') {
        cookieValue = cookieValue.substr(1, cookieValue.size() - 2);
      }
    }
    out.emplace_back(name, cookieValue);
  }
}

}  // namespace

const url::QueryParams& RequestContext::queryParams() const {
  if (!_queryParamsParsed) {
    _queryParams = url::ParseQueryString(_query);
    _queryParamsParsed = true;
  }
  return _queryParams;
}

std::optional<std::string_view> RequestContext::queryParam(std::string_view key) const {
  for (const auto& [paramKey, paramValue] : queryParams()) {
    if (paramKey == key) {
      return paramValue;
    }
  }
  return std::nullopt;
}

std::optional<std::string_view> RequestContext::header(std::string_view name) const noexcept {
  for (const auto& [headerName, headerValue] : _headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      return headerValue;
    }
  }
  return std::nullopt;
}

const RequestContext::Cookies& RequestContext::cookies() const {
  if (!_cookiesParsed) {
    for (const auto& [headerName, headerValue] : _headers) {
      if (CaseInsensitiveEqual(headerName, http::Cookie)) {
        ParseCookieHeader(headerValue, _cookies);
      }
    }
    _cookiesParsed = true;
  }
  return _cookies;
}

std::optional<std::string_view> RequestContext::cookie(std::string_view name) const {
  for (const auto& [cookieName, cookieValue] : cookies()) {
    if (cookieName == name) {
      return cookieValue;
    }
  }
  return std::nullopt;
}

void RequestContext::sendRedirect(std::string_view location) {
  _status = http::StatusCodeFound;
  _redirectTarget = location;
}

void RequestContext::setCookie(std::string_view name, std::string_view value, std::string_view attributes) {
  std::string& cookie = _outgoingCookies.emplace_back();
  cookie.reserve(name.size() + 1U + value.size() + 2U + attributes.size());
  cookie.append(name);
  cookie.push_back('=');
  cookie.append(value);
  if (!attributes.empty()) {
    cookie.append("; ");
    cookie.append(attributes);
  }
}

void RequestContext::resetResponse() {
  _status = http::StatusCodeOK;
  _responseBody.clear();
  _responseHeaders.clear();
  _contentType = http::ContentTypeTextHtml;
  _redirectTarget.clear();
  _outgoingCookies.clear();
}

SessionHandle RequestContext::session() {
  if (_sessionStore == nullptr) {
    throw std::logic_error("No session store bound to this request");
  }
  if (!_session.isLive()) {
    _session = _sessionStore->getOrCreate(*this);
  }
  return _session;
}

AsyncContext RequestContext::startAsync() {
  if (_asyncStarted) {
    throw ProtocolMisuse("startAsync() called twice on the same request");
  }
  if (!_completionQueue) {
    throw std::logic_error("No worker bound to this request");
  }
  auto state = std::make_shared<AsyncContext::State>();
  state->context = shared_from_this();
  state->completionQueue = _completionQueue;
  _asyncStarted = true;
  return AsyncContext(std::move(state));
}

void RequestContext::flush() {
  if (!_completionQueue) {
    throw std::logic_error("No worker bound to this request");
  }
  if (isAsyncCompleted()) {
    throw ProtocolMisuse("flush() called on an already completed async request");
  }
  {
    std::scoped_lock lock(_flushMutex);
    if (!_streaming) {
      _chunked = _keepAlive && _version == http::HTTP11Sv;
      if (!_chunked) {
        _keepAlive = false;
      }
      AppendStreamHead(_flushedOutput, *this, _serverName, SysClock::now(), _chunked);
      _streaming = true;
    }
    if (_method != http::Method::HEAD) {
      AppendStreamData(_flushedOutput, _responseBody, _chunked);
    }
    _responseBody.clear();
  }
  if (_asyncStarted) {
    if (!_completionQueue->post(shared_from_this())) {
      log::debug("Flushed output of '{}' dropped, its worker is stopped", _path);
    }
  } else if (_onFlush) {
    _onFlush(*this);
  }
}

void RequestContext::takeFlushedOutput(std::string& out) {
  std::scoped_lock lock(_flushMutex);
  out.append(_flushedOutput);
  _flushedOutput.clear();
}

void RequestContext::bindWorker(int connectionFd, SessionStore* sessionStore,
                                std::shared_ptr<AsyncCompletionQueue> completionQueue, std::string_view serverName,
                                FlushHook onFlush) noexcept {
  _connectionFd = connectionFd;
  _sessionStore = sessionStore;
  _completionQueue = std::move(completionQueue);
  _serverName = serverName;
  _onFlush = std::move(onFlush);
}

}  // namespace rspd
