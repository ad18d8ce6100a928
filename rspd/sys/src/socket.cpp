#include "rspd/socket.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "rspd/base-fd.hpp"
#include "rspd/errno-throw.hpp"
#include "rspd/log.hpp"

namespace rspd {

namespace {

constexpr int ToSocketType(Socket::Type type) {
  return type == Socket::Type::StreamNonBlock ? SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC
                                              : SOCK_STREAM | SOCK_CLOEXEC;
}

in_addr ResolveIPv4(std::string_view host) {
  in_addr addr{};
  std::string hostStr(host);
  if (hostStr.empty()) {
    addr.s_addr = htonl(INADDR_ANY);
    return addr;
  }
  if (::inet_pton(AF_INET, hostStr.c_str(), &addr) == 1) {
    return addr;
  }
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  const int rc = ::getaddrinfo(hostStr.c_str(), nullptr, &hints, &res);
  if (rc != 0 || res == nullptr) {
    throw std::invalid_argument("Unable to resolve bind host '" + hostStr + "': " + ::gai_strerror(rc));
  }
  addr = reinterpret_cast<const sockaddr_in*>(res->ai_addr)->sin_addr;
  ::freeaddrinfo(res);
  return addr;
}

}  // namespace

Socket::Socket(Type type) : _baseFd(::socket(AF_INET, ToSocketType(type), 0)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(std::string_view host, uint16_t& port) {
  static constexpr int kEnable = 1;
  const int sockFd = _baseFd.fd();
  if (::setsockopt(sockFd, SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) < 0) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr = ResolveIPv4(host);
  addr.sin_port = htons(port);
  if (::bind(sockFd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
    throw_errno("bind failed on {}:{}", host, port);
  }
  if (::listen(sockFd, SOMAXCONN) < 0) {
    throw_errno("listen failed");
  }
  if (port == 0) {
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    if (::getsockname(sockFd, reinterpret_cast<sockaddr*>(&actual), &len) == -1) {
      throw_errno("getsockname failed");
    }
    port = ntohs(actual.sin_port);
  }
  log::debug("Socket fd # {} listening on {}:{}", sockFd, host, port);
}

}  // namespace rspd
