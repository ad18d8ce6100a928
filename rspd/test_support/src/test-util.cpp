#include "rspd/test-util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "rspd/errno-throw.hpp"
#include "rspd/http-constants.hpp"
#include "rspd/http-status-code.hpp"
#include "rspd/log.hpp"
#include "rspd/simple-charconv.hpp"
#include "rspd/socket.hpp"
#include "rspd/string-equal-ignore-case.hpp"
#include "rspd/timedef.hpp"

namespace rspd::test {

namespace {

constexpr std::size_t kChunkSize = 4096;

Socket ConnectLoop(uint16_t port, std::chrono::milliseconds timeout) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

  for (const auto deadline = std::chrono::steady_clock::now() + timeout; std::chrono::steady_clock::now() < deadline;
       std::this_thread::sleep_for(std::chrono::milliseconds{1})) {
    Socket sock(Socket::Type::Stream);
    if (::connect(sock.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
      return sock;
    }
    log::debug("connect failed for fd # {}: {}", sock.fd(), std::strerror(errno));
  }
  throw std::runtime_error("ClientConnection: unable to connect");
}

// Size of a complete response at the start of 'raw', if fully received.
std::optional<std::size_t> CompleteResponseSize(std::string_view raw) {
  const auto headerEnd = raw.find(http::DoubleCRLF);
  if (headerEnd == std::string_view::npos) {
    return std::nullopt;
  }
  const std::size_t bodyStart = headerEnd + http::DoubleCRLF.size();
  std::size_t contentLength = 0;
  std::string_view headers = raw.substr(0, headerEnd);
  std::size_t cursor = headers.find(http::CRLF);
  while (cursor != std::string_view::npos) {
    cursor += http::CRLF.size();
    const auto lineEnd = headers.find(http::CRLF, cursor);
    std::string_view line = headers.substr(cursor, lineEnd == std::string_view::npos ? std::string_view::npos
                                                                                       : lineEnd - cursor);
    const auto colon = line.find(':');
    if (colon != std::string_view::npos && CaseInsensitiveEqual(line.substr(0, colon), http::ContentLength)) {
      std::string_view value = line.substr(colon + 1);
      while (!value.empty() && value.front() == ' ') {
        value.remove_prefix(1);
      }
      std::from_chars(value.data(), value.data() + value.size(), contentLength);
    }
    cursor = lineEnd;
  }
  if (raw.size() < bodyStart + contentLength) {
    return std::nullopt;
  }
  return bodyStart + contentLength;
}

}  // namespace

ClientConnection::ClientConnection(uint16_t port, std::chrono::milliseconds timeout)
    : _socket(ConnectLoop(port, timeout)) {}

std::string_view ParsedResponse::header(std::string_view name) const {
  for (const auto& [key, value] : headers) {
    if (CaseInsensitiveEqual(key, name)) {
      return value;
    }
  }
  return {};
}

std::vector<std::string_view> ParsedResponse::headerValues(std::string_view name) const {
  std::vector<std::string_view> values;
  for (const auto& [key, value] : headers) {
    if (CaseInsensitiveEqual(key, name)) {
      values.emplace_back(value);
    }
  }
  return values;
}

void sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout) {
  const char* cursor = data.data();
  const auto maxTs = std::chrono::steady_clock::now() + totalTimeout;

  for (std::size_t remaining = data.size(); remaining > 0;) {
    const auto sent = ::send(fd, cursor, remaining, MSG_NOSIGNAL);
    if (sent <= 0) {
      if (std::chrono::steady_clock::now() >= maxTs) {
        log::error("sendAll timed out after {} ms: {}", totalTimeout.count(), std::strerror(errno));
        throw std::runtime_error("sendAll timed out");
      }
      std::this_thread::sleep_for(1ms);
      continue;
    }
    cursor += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
}

namespace {

// Non-blocking reads until 'done(out)' holds, the peer closes or the timeout expires.
std::string RecvLoop(int fd, std::chrono::milliseconds totalTimeout,
                     const std::function<bool(std::string_view)>& done) {
  std::string out;
  const auto maxTs = std::chrono::steady_clock::now() + totalTimeout;

  while (std::chrono::steady_clock::now() < maxTs) {
    const std::size_t oldSize = out.size();
    bool again = false;
    bool closed = false;

    out.resize_and_overwrite(oldSize + kChunkSize, [fd, oldSize, &again, &closed](char* data, std::size_t) {
      const ssize_t recvBytes = ::recv(fd, data + oldSize, kChunkSize, MSG_DONTWAIT);
      if (recvBytes == -1) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
          again = true;
          return oldSize;
        }
        throw_errno("Error from non-blocking recv");
      }
      closed = recvBytes == 0;
      return oldSize + static_cast<std::size_t>(recvBytes);
    });

    if (again) {
      std::this_thread::sleep_for(1ms);
      continue;
    }
    if (closed || done(out)) {
      break;
    }
  }
  return out;
}

}  // namespace

std::string recvWithTimeout(int fd, std::chrono::milliseconds totalTimeout) {
  return RecvLoop(fd, totalTimeout, [](std::string_view raw) { return CompleteResponseSize(raw).has_value(); });
}

std::string recvUntil(int fd, std::string_view marker, std::chrono::milliseconds totalTimeout) {
  return RecvLoop(fd, totalTimeout, [marker](std::string_view raw) { return raw.contains(marker); });
}

std::string recvUntilClosed(int fd) {
  std::string out;
  for (;;) {
    const std::size_t oldSize = out.size();
    bool timedOut = false;
    out.resize_and_overwrite(oldSize + kChunkSize, [fd, oldSize, &timedOut](char* data, std::size_t) {
      const ssize_t recvBytes = ::recv(fd, data + oldSize, kChunkSize, 0);
      if (recvBytes == -1) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
          timedOut = true;
          return oldSize;
        }
        throw_errno("Error from blocking recv");
      }
      return oldSize + static_cast<std::size_t>(recvBytes);
    });

    if (timedOut || out.size() == oldSize) {
      break;
    }
  }
  return out;
}

void setRecvTimeout(int fd, SysDuration timeout) {
  const auto timeoutMs = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();
  timeval tv{static_cast<time_t>(timeoutMs / 1000), static_cast<suseconds_t>((timeoutMs % 1000) * 1000)};
  if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == -1) {
    throw_errno("Error from setRecvTimeout");
  }
}

std::string buildRequest(const RequestOptions& opt) {
  std::string req;
  req.reserve(256 + opt.body.size());
  req.append(opt.method).append(" ").append(opt.target).append(" HTTP/1.1\r\n");
  req.append("Host: localhost\r\n");
  req.append("Connection: ").append(opt.connection).append(http::CRLF);
  for (const auto& [name, value] : opt.headers) {
    req.append(name).append(http::HeaderSep).append(value).append(http::CRLF);
  }
  if (!opt.body.empty()) {
    req.append("Content-Length: ").append(std::to_string(opt.body.size())).append(http::CRLF);
  }
  req.append(http::CRLF);
  req.append(opt.body);
  return req;
}

std::string requestRaw(uint16_t port, const RequestOptions& opt) {
  ClientConnection cnx(port);
  setRecvTimeout(cnx.fd(), opt.recvTimeout);
  sendAll(cnx.fd(), buildRequest(opt));
  return recvUntilClosed(cnx.fd());
}

ParsedResponse request(uint16_t port, const RequestOptions& opt) {
  const std::string raw = requestRaw(port, opt);
  auto parsed = parseResponse(raw);
  if (!parsed) {
    throw std::runtime_error("Unable to parse response: '" + raw + "'");
  }
  return std::move(*parsed);
}

std::optional<ParsedResponse> parseResponse(std::string_view raw) {
  ParsedResponse pr;
  const std::size_t pos = raw.find(http::CRLF);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  std::string_view statusLine = raw.substr(0, pos);
  const auto firstSpace = statusLine.find(' ');
  if (firstSpace == std::string_view::npos || statusLine.size() < firstSpace + 4) {
    return std::nullopt;
  }
  const auto codeEnd = statusLine.find(' ', firstSpace + 1);
  if (codeEnd != std::string_view::npos) {
    pr.reason = statusLine.substr(codeEnd + 1);
  }
  pr.statusCode = static_cast<http::StatusCode>(read3(statusLine.data() + firstSpace + 1));
  const std::size_t headerEnd = raw.find(http::DoubleCRLF, pos);
  if (headerEnd == std::string_view::npos) {
    return std::nullopt;
  }
  std::size_t cursor = pos + http::CRLF.size();
  while (cursor < headerEnd) {
    std::size_t lineEnd = raw.find(http::CRLF, cursor);
    std::string_view line = raw.substr(cursor, lineEnd - cursor);
    cursor = lineEnd + http::CRLF.size();
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    std::size_t valueStart = colon + 1;
    if (valueStart < line.size() && line[valueStart] == ' ') {
      ++valueStart;
    }
    pr.headers.emplace_back(line.substr(0, colon), line.substr(valueStart));
  }
  pr.body = raw.substr(headerEnd + http::DoubleCRLF.size());
  return pr;
}

std::optional<std::string> decodeChunkedBody(std::string_view body) {
  std::string decoded;
  for (;;) {
    const auto sizeEnd = body.find(http::CRLF);
    if (sizeEnd == std::string_view::npos) {
      return std::nullopt;
    }
    std::size_t chunkSize = 0;
    const auto [ptr, ec] = std::from_chars(body.data(), body.data() + sizeEnd, chunkSize, 16);
    if (ec != std::errc{} || ptr != body.data() + sizeEnd) {
      return std::nullopt;
    }
    body.remove_prefix(sizeEnd + http::CRLF.size());
    if (chunkSize == 0) {
      return body.starts_with(http::CRLF) ? std::optional<std::string>(std::move(decoded)) : std::nullopt;
    }
    if (body.size() < chunkSize + http::CRLF.size() || body.substr(chunkSize, http::CRLF.size()) != http::CRLF) {
      return std::nullopt;
    }
    decoded.append(body.substr(0, chunkSize));
    body.remove_prefix(chunkSize + http::CRLF.size());
  }
}

int countOccurrences(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) {
    return 0;
  }
  int count = 0;
  std::size_t pos = 0;
  while ((pos = haystack.find(needle, pos)) != std::string_view::npos) {
    ++count;
    pos += needle.size();
  }
  return count;
}

bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char buf[256];
  while (std::chrono::steady_clock::now() < deadline) {
    const auto ret = ::recv(fd, buf, sizeof(buf), MSG_DONTWAIT);
    if (ret == 0) {
      return true;
    }
    if (ret == -1 && errno != EAGAIN && errno != EWOULDBLOCK) {
      return errno == ECONNRESET;
    }
    std::this_thread::sleep_for(1ms);
  }
  return false;
}

bool WaitFor(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!predicate()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

}  // namespace rspd::test
