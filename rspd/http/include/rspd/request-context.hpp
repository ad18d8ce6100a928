#pragma once

#include <fmt/format.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rspd/async-context.hpp"
#include "rspd/http-constants.hpp"
#include "rspd/http-method.hpp"
#include "rspd/http-status-code.hpp"
#include "rspd/session-store.hpp"
#include "rspd/timedef.hpp"
#include "rspd/url-decode.hpp"

namespace rspd {

struct RequestParseResult;

// State of one HTTP request and of the response being built for it.
//
// Created by the parser, used exclusively by the worker thread serving the connection, except while detached through
// startAsync() where ownership moves into the returned AsyncContext.
class RequestContext : public std::enable_shared_from_this<RequestContext> {
 public:
  using HeaderPair = std::pair<std::string, std::string>;
  using Headers = std::vector<HeaderPair>;
  using Cookies = std::vector<std::pair<std::string, std::string>>;

  RequestContext() = default;

  RequestContext(const RequestContext&) = delete;
  RequestContext(RequestContext&&) = delete;
  RequestContext& operator=(const RequestContext&) = delete;
  RequestContext& operator=(RequestContext&&) = delete;

  ~RequestContext() = default;

  // ---- Request ----

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  [[nodiscard]] std::string_view methodStr() const noexcept { return http::ToMethodStr(_method); }

  // "HTTP/1.0" or "HTTP/1.1"
  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  // The URL decoded path, without the query string. Never empty.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // The raw (not decoded) query string, without the '?'.
  [[nodiscard]] std::string_view query() const noexcept { return _query; }

  // Decoded query parameters, in request order. Computed on first call.
  [[nodiscard]] const url::QueryParams& queryParams() const;

  // First value of the query parameter 'key', if present.
  [[nodiscard]] std::optional<std::string_view> queryParam(std::string_view key) const;

  // Request headers in request order. Duplicates are kept.
  [[nodiscard]] const Headers& headers() const noexcept { return _headers; }

  [[nodiscard]] std::size_t headerCount() const noexcept { return _headers.size(); }

  // Throws std::out_of_range if pos >= headerCount().
  [[nodiscard]] std::string_view headerName(std::size_t pos) const { return _headers.at(pos).first; }
  [[nodiscard]] std::string_view headerValue(std::size_t pos) const { return _headers.at(pos).second; }

  // Value of the first header named 'name' (case-insensitive), if present.
  [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view headerOrEmpty(std::string_view name) const noexcept {
    return header(name).value_or(std::string_view{});
  }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Cookies sent by the client, from all 'Cookie' headers. Computed on first call.
  [[nodiscard]] const Cookies& cookies() const;

  [[nodiscard]] std::optional<std::string_view> cookie(std::string_view name) const;

  // Time at which the request was fully received.
  [[nodiscard]] SteadyTimePoint startTime() const noexcept { return _startTime; }
  [[nodiscard]] SysTimePoint receivedAt() const noexcept { return _receivedAt; }

  // Whether the connection should stay open after the response.
  [[nodiscard]] bool keepAlive() const noexcept { return _keepAlive; }

  // Forces the connection to be closed after the response.
  void closeConnection() noexcept { _keepAlive = false; }

  // ---- Response ----

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  void setStatus(http::StatusCode status) noexcept { _status = status; }

  // Appends to the response body.
  void write(std::string_view data) { _responseBody.append(data); }

  template <class... Args>
  void print(fmt::format_string<Args...> fmt, Args&&... args) {
    fmt::format_to(std::back_inserter(_responseBody), fmt, std::forward<Args>(args)...);
  }

  [[nodiscard]] const std::string& responseBody() const noexcept { return _responseBody; }

  // Adds a response header. Content-Length, Connection, Date and Server are managed by the server.
  void addHeader(std::string_view name, std::string_view value) { _responseHeaders.emplace_back(name, value); }

  [[nodiscard]] const Headers& responseHeaders() const noexcept { return _responseHeaders; }

  // Defaults to text/html.
  void setContentType(std::string_view contentType) { _contentType = contentType; }

  [[nodiscard]] std::string_view contentType() const noexcept { return _contentType; }

  // Turns the response into a 302 Found redirecting to 'location'.
  void sendRedirect(std::string_view location);

  [[nodiscard]] std::string_view redirectTarget() const noexcept { return _redirectTarget; }

  // Adds a 'Set-Cookie: name=value; <attributes>' response header.
  void setCookie(std::string_view name, std::string_view value, std::string_view attributes = "path=/");

  [[nodiscard]] const std::vector<std::string>& outgoingCookies() const noexcept { return _outgoingCookies; }

  // Discards the response built so far (status, body, headers and cookies).
  void resetResponse();

  // ---- Streaming ----

  // Sends the response head on first call, then the body written so far, which is cleared.
  // The body is sent chunked on HTTP/1.1 keep-alive connections, otherwise it ends with the connection.
  // Status, headers and cookies set after the first flush are not sent.
  // May be called from a detached request's thread until AsyncContext::complete().
  // Throws std::logic_error if the request is not served by a server, ProtocolMisuse once the async request completed.
  void flush();

  // Whether flush() has been called, so that the head is already sent.
  [[nodiscard]] bool isStreaming() const noexcept { return _streaming; }

  [[nodiscard]] bool isChunked() const noexcept { return _chunked; }

  // Abandons a started stream: no terminating chunk is sent and the connection is closed.
  void failStream() noexcept {
    _streamFailed = true;
    _keepAlive = false;
  }

  [[nodiscard]] bool streamFailed() const noexcept { return _streamFailed; }

  // Server side: moves the output flushed so far to the end of 'out'.
  void takeFlushedOutput(std::string& out);

  // ---- Session ----

  // Returns the session of the client, creating it if needed.
  // Throws std::logic_error if the request is not served by a server.
  SessionHandle session();

  // ---- Async ----

  // Detaches this request from its worker without sending a response.
  // The worker stops reading from the connection until AsyncContext::complete() is called.
  // Throws ProtocolMisuse if called twice, std::logic_error if the request is not served by a server.
  AsyncContext startAsync();

  [[nodiscard]] bool isAsync() const noexcept { return _asyncStarted; }

  // Whether AsyncContext::complete() handed this request back to its worker.
  [[nodiscard]] bool isAsyncCompleted() const noexcept { return _asyncCompleted.load(std::memory_order_acquire); }

  // ---- Server side ----

  using FlushHook = std::function<void(RequestContext&)>;

  // Called by the worker before dispatch. 'onFlush' is called on the worker thread by flush() on a request that is not
  // detached, detached requests post their output to 'completionQueue' instead.
  void bindWorker(int connectionFd, SessionStore* sessionStore, std::shared_ptr<AsyncCompletionQueue> completionQueue,
                  std::string_view serverName = http::DefaultServerName, FlushHook onFlush = {}) noexcept;

  [[nodiscard]] int connectionFd() const noexcept { return _connectionFd; }

 private:
  friend class AsyncContext;
  friend RequestParseResult ParseRequest(std::string_view data, std::size_t maxHeaderBytes,
                                         std::size_t maxBodyBytes);

  http::Method _method{http::Method::GET};
  http::StatusCode _status{http::StatusCodeOK};
  bool _keepAlive{true};
  bool _asyncStarted{false};
  bool _streaming{false};
  bool _chunked{false};
  bool _streamFailed{false};
  std::atomic<bool> _asyncCompleted{false};
  mutable bool _queryParamsParsed{false};
  mutable bool _cookiesParsed{false};
  int _connectionFd{-1};
  std::string_view _version{http::HTTP11Sv};
  std::string _path;
  std::string _query;
  Headers _headers;
  std::string _body;
  mutable url::QueryParams _queryParams;
  mutable Cookies _cookies;
  SteadyTimePoint _startTime{SteadyClock::now()};
  SysTimePoint _receivedAt{SysClock::now()};

  std::string _responseBody;
  Headers _responseHeaders;
  std::string _contentType{http::ContentTypeTextHtml};
  std::string _redirectTarget;
  std::vector<std::string> _outgoingCookies;

  SessionStore* _sessionStore{nullptr};
  SessionHandle _session;
  std::shared_ptr<AsyncCompletionQueue> _completionQueue;
  std::string_view _serverName;
  FlushHook _onFlush;

  std::mutex _flushMutex;
  std::string _flushedOutput;
};

}  // namespace rspd
