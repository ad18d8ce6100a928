#include "rspd/connection.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>

#include "rspd/base-fd.hpp"
#include "rspd/log.hpp"
#include "rspd/socket.hpp"

namespace rspd {

namespace {

int AcceptConnectionFd(int socketFd) {
  sockaddr_in inAddr{};
  socklen_t inLen = sizeof(inAddr);
  int fd = ::accept4(socketFd, reinterpret_cast<sockaddr*>(&inAddr), &inLen, SOCK_NONBLOCK | SOCK_CLOEXEC);
  if (fd < 0) {
    const auto savedErr = errno;
    if (savedErr == EAGAIN || savedErr == EWOULDBLOCK) {
      log::trace("Connection accept would block");
    } else {
      log::error("Connection accept failed for socket fd # {}: {}", socketFd, std::strerror(savedErr));
    }
    return BaseFd::kClosedFd;
  }
  log::debug("Connection fd # {} opened", fd);
  return fd;
}

}  // namespace

Connection::Connection(const Socket& socket) : _baseFd(AcceptConnectionFd(socket.fd())) {}

}  // namespace rspd
