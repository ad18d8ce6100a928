#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace rspd {

// Enable TCP_NODELAY (disable Nagle's algorithm) on a TCP socket.
bool SetTcpNoDelay(int fd) noexcept;

// Send data on a connected socket without raising SIGPIPE.
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept;

inline int64_t SafeSend(int fd, std::string_view data) noexcept { return SafeSend(fd, data.data(), data.size()); }

}  // namespace rspd
