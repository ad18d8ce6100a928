#include "rspd/socket-ops.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cstddef>
#include <cstdint>

namespace rspd {

bool SetTcpNoDelay(int fd) noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == 0;
}

int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept {
  return static_cast<int64_t>(::send(fd, data, len, MSG_NOSIGNAL));
}

}  // namespace rspd
