#pragma once

#include <cstdint>
#include <string_view>

#include "rspd/base-fd.hpp"

namespace rspd {

// Simple RAII class wrapping an IPv4 TCP listening socket file descriptor.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Throws std::system_error on failure.
  explicit Socket(Type type);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind to host (numeric IPv4 address or resolvable name) and start listening.
  // If port is 0, an ephemeral port is chosen and written back into the argument.
  // Throws std::system_error on failure, std::invalid_argument if host cannot be resolved.
  void bindAndListen(std::string_view host, uint16_t& port);

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace rspd
