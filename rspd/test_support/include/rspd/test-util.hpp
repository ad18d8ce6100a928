#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rspd/http-status-code.hpp"
#include "rspd/socket.hpp"
#include "rspd/timedef.hpp"

namespace rspd::test {
using namespace std::chrono_literals;

// Blocking client socket connected to 127.0.0.1:port (retried until timeout).
class ClientConnection {
 public:
  ClientConnection() noexcept = default;

  explicit ClientConnection(uint16_t port, std::chrono::milliseconds timeout = std::chrono::milliseconds{500});

  [[nodiscard]] int fd() const noexcept { return _socket.fd(); }

 private:
  Socket _socket;
};

// Minimal parsed HTTP response representation for test assertions.
struct ParsedResponse {
  http::StatusCode statusCode{0};
  std::string reason;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;

  // First value of the given header (case-insensitive name), or empty.
  [[nodiscard]] std::string_view header(std::string_view name) const;

  // All values of the given header (case-insensitive name).
  [[nodiscard]] std::vector<std::string_view> headerValues(std::string_view name) const;
};

struct RequestOptions {
  std::string method{"GET"};
  std::string target{"/"};
  std::string connection{"close"};
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;
  std::chrono::milliseconds recvTimeout{2000ms};
};

void sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout = 500ms);

// Reads until one complete response (headers + Content-Length body) has been received, or timeout.
std::string recvWithTimeout(int fd, std::chrono::milliseconds totalTimeout = 2000ms);

// Reads until 'marker' has been received, the peer closes or timeout.
std::string recvUntil(int fd, std::string_view marker, std::chrono::milliseconds totalTimeout = 2000ms);

// Reads until the peer closes the connection (or the receive timeout set on the socket expires).
std::string recvUntilClosed(int fd);

void setRecvTimeout(int fd, SysDuration timeout);

std::string buildRequest(const RequestOptions& opt);

// Sends one request on a fresh connection and returns the raw response bytes.
std::string requestRaw(uint16_t port, const RequestOptions& opt = {});

// Same as requestRaw, parsed. Throws std::runtime_error if the response cannot be parsed.
ParsedResponse request(uint16_t port, const RequestOptions& opt = {});

// Very small HTTP/1.1 response parser (not resilient to all malformed cases, just for test consumption).
std::optional<ParsedResponse> parseResponse(std::string_view raw);

// Decodes a complete chunked body (up to and including the terminating chunk). nullopt if malformed or incomplete.
std::optional<std::string> decodeChunkedBody(std::string_view body);

int countOccurrences(std::string_view haystack, std::string_view needle);

// Returns true if the peer closed the connection (recv returns 0) within the timeout.
bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout);

// Polls 'predicate' every millisecond until it returns true or the timeout expires.
bool WaitFor(const std::function<bool()>& predicate, std::chrono::milliseconds timeout);

}  // namespace rspd::test
