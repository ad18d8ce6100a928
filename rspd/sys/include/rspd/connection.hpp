#pragma once

#include "rspd/base-fd.hpp"
#include "rspd/socket.hpp"

namespace rspd {

// Simple RAII class wrapping a non-blocking connection accepted on a listening socket.
class Connection {
 public:
  Connection() noexcept = default;

  // Accepts a pending connection. Resulting object is falsy if none was pending or accept failed (logged).
  explicit Connection(const Socket& socket);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace rspd
