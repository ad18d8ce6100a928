#include "rspd/signal-handler.hpp"

#include <csignal>

namespace {

volatile std::sig_atomic_t g_receivedSignal{};

}  // namespace

extern "C" void RspdSignalHandler(int sigNum) { g_receivedSignal = sigNum; }

namespace rspd {

void SignalHandler::Enable() {
  std::signal(SIGINT, ::RspdSignalHandler);
  std::signal(SIGTERM, ::RspdSignalHandler);
}

bool SignalHandler::IsStopRequested() { return g_receivedSignal != 0; }

int SignalHandler::ReceivedSignal() { return static_cast<int>(g_receivedSignal); }

}  // namespace rspd
