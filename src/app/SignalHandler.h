#pragma once

#include <atomic>
#include <chrono>

class SignalHandler {
public:
  static void init();
  static bool shouldExit();
  static void setExit();

  // Sleeps in short slices; returns false if an exit was requested meanwhile.
  static bool sleepFor(std::chrono::milliseconds duration);

private:
  static void handleSignal(int signum);
  static std::atomic<bool> exitFlag_;
};
