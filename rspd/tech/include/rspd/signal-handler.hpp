#pragma once

namespace rspd {

// Process wide SIGINT / SIGTERM latch for programs embedding a server.
// The handler only records the signal, the owner of the server polls it and calls Server::stop().
class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  static void Enable();

  [[nodiscard]] static bool IsStopRequested();

  // Number of the last termination signal received, 0 if none.
  [[nodiscard]] static int ReceivedSignal();
};

}  // namespace rspd
