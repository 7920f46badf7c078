#include "SignalHandler.h"
#include <algorithm>
#include <csignal>
#include <thread>

std::atomic<bool> SignalHandler::exitFlag_(false);

void SignalHandler::init() {
  std::signal(SIGINT, handleSignal);
  std::signal(SIGTERM, handleSignal);
  // A vanished RTP/SIP peer must not kill the daemon on send().
  std::signal(SIGPIPE, SIG_IGN);
}

bool SignalHandler::shouldExit() { return exitFlag_; }

// Async-signal context: only the atomic store is safe here, so no logging.
void SignalHandler::handleSignal(int) { setExit(); }

void SignalHandler::setExit() { exitFlag_ = true; }

bool SignalHandler::sleepFor(std::chrono::milliseconds duration) {
  const auto slice = std::chrono::milliseconds(100);
  auto deadline = std::chrono::steady_clock::now() + duration;
  while (!shouldExit()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      return true;
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
        slice, deadline - now));
  }
  return false;
}
