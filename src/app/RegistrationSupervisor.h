#pragma once

#include "../telephony/TelephonyEngine.h"
#include "Config.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

class CallSessionOrchestrator;

// Outer retry loop around the telephony engine: create, register, hand the
// engine to the orchestrator while registered, and start over after a fixed
// delay when registration fails or is lost.
class RegistrationSupervisor : public TelephonyListener {
public:
  using EngineFactory = std::function<std::unique_ptr<TelephonyEngine>()>;

  RegistrationSupervisor(const SupervisorConfig &config, EngineFactory factory,
                         CallSessionOrchestrator &orchestrator,
                         MediaPort &media);
  ~RegistrationSupervisor() override;

  // Blocks until a stop is requested (true) or the retry budget is
  // exhausted (false).
  bool run();
  void requestStop();

  int attempts() const { return attempts_; }

  void onRegistrationState(bool registered, int code,
                           const std::string &reason) override;
  void onCallState(const CallEvent &event) override;

private:
  enum class Outcome { Pending, Registered, Failed };

  bool stopRequested() const;
  bool tryRegister();
  void waitForLoss();
  void teardown();
  // Interruptible sleep; false when a stop was requested.
  bool pause(std::chrono::milliseconds duration);

  const SupervisorConfig config_;
  EngineFactory factory_;
  CallSessionOrchestrator &orchestrator_;
  MediaPort &media_;

  std::unique_ptr<TelephonyEngine> engine_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  Outcome outcome_ = Outcome::Pending;
  bool registered_ = false;
  std::atomic<bool> stop_{false};
  std::atomic<int> attempts_{0};
};
