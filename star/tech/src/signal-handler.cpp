#include "star/signal-handler.hpp"

#include <csignal>

#include "star/log.hpp"

namespace {

volatile std::sig_atomic_t g_signalStatus{};

}  // namespace

extern "C" void StarSignalHandler(int sigNum) { g_signalStatus = sigNum; }

namespace star {

void SignalHandler::Enable() {
  std::signal(SIGINT, ::StarSignalHandler);
  std::signal(SIGTERM, ::StarSignalHandler);
  log::debug("SIGINT and SIGTERM handlers installed");
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

bool SignalHandler::IsStopRequested() { return g_signalStatus != 0; }

void SignalHandler::ResetStopRequest() { g_signalStatus = 0; }

}  // namespace star
