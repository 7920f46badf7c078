#include "RegistrationSupervisor.h"
#include "../call/CallSessionOrchestrator.h"
#include "Logger.h"
#include "SignalHandler.h"
#include <algorithm>
#include <string>

namespace {
constexpr std::chrono::milliseconds kSlice{100};
}

RegistrationSupervisor::RegistrationSupervisor(
    const SupervisorConfig &config, EngineFactory factory,
    CallSessionOrchestrator &orchestrator, MediaPort &media)
    : config_(config), factory_(std::move(factory)),
      orchestrator_(orchestrator), media_(media) {}

RegistrationSupervisor::~RegistrationSupervisor() { teardown(); }

bool RegistrationSupervisor::stopRequested() const {
  return stop_ || SignalHandler::shouldExit();
}

void RegistrationSupervisor::requestStop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
}

void RegistrationSupervisor::onRegistrationState(bool registered, int code,
                                                 const std::string &reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    registered_ = registered;
    if (outcome_ == Outcome::Pending)
      outcome_ = registered ? Outcome::Registered : Outcome::Failed;
  }
  if (registered)
    LOG_INFO("SIP registration successful (" << code << " " << reason << ")");
  else
    LOG_WARN("SIP registration failed or lost (" << code << " " << reason
                                                 << ")");
  cv_.notify_all();
  orchestrator_.onRegistrationState(registered, code, reason);
}

void RegistrationSupervisor::onCallState(const CallEvent &event) {
  orchestrator_.onCallState(event);
}

bool RegistrationSupervisor::run() {
  attempts_ = 0;
  while (!stopRequested()) {
    int attempt = ++attempts_;
    LOG_INFO("Registration attempt " << attempt
                                     << (config_.maxRetries > 0
                                             ? "/" + std::to_string(config_.maxRetries)
                                             : std::string()));

    if (tryRegister()) {
      attempts_ = 0;
      orchestrator_.attachEngine(engine_.get());
      LOG_INFO("Gateway is ready to receive calls");

      waitForLoss();
      orchestrator_.detachEngine();
      if (stopRequested())
        break;
      LOG_WARN("Registration lost, reconnecting");
    }

    teardown();
    if (stopRequested())
      break;

    if (config_.maxRetries > 0 && attempts_ >= config_.maxRetries) {
      LOG_ERROR("Giving up after " << attempts_ << " registration attempts");
      return false;
    }

    LOG_INFO("Retrying in " << config_.retryDelaySec << " seconds...");
    if (!pause(std::chrono::seconds(config_.retryDelaySec)))
      break;
  }

  teardown();
  LOG_INFO("Registration supervisor stopped");
  return true;
}

bool RegistrationSupervisor::tryRegister() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    outcome_ = Outcome::Pending;
    registered_ = false;
  }

  engine_ = factory_();
  if (!engine_) {
    LOG_ERROR("Failed to create telephony engine");
    return false;
  }
  if (!engine_->start(this, &media_)) {
    LOG_ERROR("Failed to start telephony engine");
    return false;
  }

  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::seconds(config_.registrationTimeoutSec);
  std::unique_lock<std::mutex> lock(mutex_);
  while (outcome_ == Outcome::Pending && !stop_) {
    if (SignalHandler::shouldExit())
      return false;
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      LOG_WARN("No registration response within "
               << config_.registrationTimeoutSec << "s");
      return false;
    }
    cv_.wait_for(lock, std::min<std::chrono::steady_clock::duration>(
                           kSlice, deadline - now));
  }
  return outcome_ == Outcome::Registered && registered_;
}

void RegistrationSupervisor::waitForLoss() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (registered_ && !stop_ && !SignalHandler::shouldExit())
    cv_.wait_for(lock, kSlice);
}

void RegistrationSupervisor::teardown() {
  if (!engine_)
    return;
  engine_->stop();
  engine_.reset();
}

bool RegistrationSupervisor::pause(std::chrono::milliseconds duration) {
  auto deadline = std::chrono::steady_clock::now() + duration;
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop_ && !SignalHandler::shouldExit()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      return true;
    cv_.wait_for(lock, std::min<std::chrono::steady_clock::duration>(
                           kSlice, deadline - now));
  }
  return false;
}
