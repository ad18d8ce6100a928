#include "rspd/socket.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <system_error>

#include "rspd/connection.hpp"

namespace rspd {

TEST(Socket, Nominal) {
  Socket sock(Socket::Type::Stream);
  EXPECT_TRUE(sock);
  EXPECT_GE(sock.fd(), 0);
  sock.close();
  EXPECT_FALSE(sock);
}

TEST(Socket, BindAndListenUpdatesPort) {
  Socket sock(Socket::Type::StreamNonBlock);
  uint16_t port = 0;
  EXPECT_NO_THROW(sock.bindAndListen("127.0.0.1", port));
  EXPECT_NE(0, port);
}

TEST(Socket, BindAndListenResolvesLocalhost) {
  Socket sock(Socket::Type::Stream);
  uint16_t port = 0;
  EXPECT_NO_THROW(sock.bindAndListen("localhost", port));
  EXPECT_NE(0, port);
}

TEST(Socket, BindAndListenThrowsWhenPortInUse) {
  Socket first(Socket::Type::Stream);
  uint16_t port = 0;
  first.bindAndListen("127.0.0.1", port);
  Socket second(Socket::Type::Stream);
  EXPECT_THROW(second.bindAndListen("127.0.0.1", port), std::system_error);
}

TEST(Socket, UnresolvableHostThrows) {
  Socket sock(Socket::Type::Stream);
  uint16_t port = 0;
  EXPECT_THROW(sock.bindAndListen("no-such-host.invalid", port), std::invalid_argument);
}

TEST(Connection, AcceptWithoutPendingClientIsFalsy) {
  Socket sock(Socket::Type::StreamNonBlock);
  uint16_t port = 0;
  sock.bindAndListen("127.0.0.1", port);
  Connection cnx(sock);
  EXPECT_FALSE(cnx);
}

}  // namespace rspd
