#include "CallSessionOrchestrator.h"
#include "../app/Logger.h"

const char *callPhaseName(CallPhase phase) {
  switch (phase) {
  case CallPhase::NoCall:
    return "NoCall";
  case CallPhase::Ringing:
    return "Ringing";
  case CallPhase::MediaActive:
    return "MediaActive";
  case CallPhase::Ended:
    return "Ended";
  }
  return "Unknown";
}

CallSessionOrchestrator::CallSessionOrchestrator(
    EventLoop &loop, DuplexAudioBridge &bridge, FrameAssembler &assembler,
    SessionFactory factory, std::chrono::milliseconds autoAnswerDelay)
    : loop_(loop), bridge_(bridge), assembler_(assembler),
      factory_(std::move(factory)), autoAnswerDelay_(autoAnswerDelay) {}

CallSessionOrchestrator::~CallSessionOrchestrator() {
  stopPlaybackPump();
  if (session_)
    session_->stop();
}

void CallSessionOrchestrator::attachEngine(TelephonyEngine *engine) {
  loop_.post([this, engine] { engine_ = engine; });
  loop_.waitIdle();
}

void CallSessionOrchestrator::detachEngine() {
  loop_.post([this] {
    if (phase_ == CallPhase::Ringing || phase_ == CallPhase::MediaActive)
      endCall("telephony engine detached");
    engine_ = nullptr;
  });
  loop_.waitIdle();
}

void CallSessionOrchestrator::shutdown() {
  loop_.post([this] {
    if (phase_ == CallPhase::Ringing || phase_ == CallPhase::MediaActive)
      endCall("shutdown");
  });
  loop_.waitIdle();
}

void CallSessionOrchestrator::onRegistrationState(bool registered, int code,
                                                  const std::string &reason) {
  LOG_DEBUG("Orchestrator saw registration " << (registered ? "up" : "down")
                                             << " (" << code << " " << reason
                                             << ")");
}

void CallSessionOrchestrator::onCallState(const CallEvent &event) {
  LOG_DEBUG("Call " << event.callId << " -> " << callStateName(event.state));
  if (!loop_.post([this, event] { handleCallEvent(event); }))
    LOG_WARN("Event loop stopped, dropping " << callStateName(event.state)
                                             << " for call " << event.callId);
}

void CallSessionOrchestrator::onAiInterrupted() {
  size_t queued = bridge_.flushTelephonyQueue();
  assembler_.clear();
  LOG_DEBUG("Barge-in: dropped " << queued << " queued playback chunks");
}

void CallSessionOrchestrator::onAiSessionEnded() {
  loop_.post([this] {
    if (session_ && !session_->isActive()) {
      LOG_INFO("AI session ended remotely, releasing it");
      session_->stop();
    }
  });
}

void CallSessionOrchestrator::handleCallEvent(const CallEvent &event) {
  switch (event.state) {
  case CallState::Ringing:
    onRinging(event);
    break;
  case CallState::MediaActive:
    onMediaActive(event);
    break;
  case CallState::Ended:
    onEnded(event);
    break;
  }
}

void CallSessionOrchestrator::onRinging(const CallEvent &event) {
  if ((phase_ == CallPhase::Ringing || phase_ == CallPhase::MediaActive) &&
      event.callId != currentCallId_) {
    LOG_WARN("Ignoring incoming call " << event.callId << ", call "
                                       << currentCallId_ << " is in progress");
    return;
  }
  if (phase_ != CallPhase::NoCall && phase_ != CallPhase::Ended)
    return;

  LOG_INFO("Incoming call " << event.callId << " from " << event.remoteUri);
  phase_ = CallPhase::Ringing;
  currentCallId_ = event.callId;

  std::string callId = event.callId;
  loop_.postDelayed(autoAnswerDelay_, [this, callId] { autoAnswer(callId); });
}

void CallSessionOrchestrator::autoAnswer(const std::string &callId) {
  if (phase_ != CallPhase::Ringing || currentCallId_ != callId)
    return; // cancelled or already answered
  if (!engine_) {
    LOG_WARN("No telephony engine to answer call " << callId);
    return;
  }
  LOG_INFO("Auto-answering call " << callId);
  if (!engine_->answer(callId, 200))
    LOG_ERROR("Failed to answer call " << callId);
}

void CallSessionOrchestrator::onMediaActive(const CallEvent &event) {
  if (event.callId == lastEndedCallId_) {
    LOG_DEBUG("Dropping late media notification for ended call "
              << event.callId);
    return;
  }

  if (phase_ == CallPhase::MediaActive) {
    if (event.callId == currentCallId_)
      LOG_INFO("Media active again for call " << event.callId
                                              << ", session already running");
    else
      LOG_WARN("Ignoring media for call " << event.callId << ", call "
                                          << currentCallId_ << " is active");
    return;
  }

  if (phase_ == CallPhase::Ringing && event.callId != currentCallId_) {
    LOG_WARN("Ignoring media for call " << event.callId << ", call "
                                        << currentCallId_ << " is ringing");
    return;
  }

  if (session_ && session_->isActive()) {
    LOG_WARN("AI session already active, skipping start");
    return;
  }

  beginMedia(event.callId);
}

void CallSessionOrchestrator::onEnded(const CallEvent &event) {
  if (event.callId != currentCallId_ ||
      (phase_ != CallPhase::Ringing && phase_ != CallPhase::MediaActive)) {
    LOG_DEBUG("Ignoring end of call " << event.callId << " (current "
                                      << currentCallId_ << ", "
                                      << callPhaseName(phase_) << ")");
    return;
  }
  endCall("call ended");
}

void CallSessionOrchestrator::beginMedia(const std::string &callId) {
  LOG_INFO("Call " << callId << " connected, starting AI session");
  phase_ = CallPhase::MediaActive;
  currentCallId_ = callId;

  bridge_.resetForNewCall();
  assembler_.clear();

  if (session_)
    session_->stop();
  session_ = factory_(this);
  if (!session_->start())
    LOG_ERROR("AI session failed to start for call " << callId
                                                     << ", caller hears silence");

  startPlaybackPump();
}

void CallSessionOrchestrator::endCall(const std::string &reason) {
  LOG_INFO("Tearing down call " << currentCallId_ << " (" << reason << ")");

  if (session_) {
    session_->stop();
    session_.reset();
  }
  stopPlaybackPump();
  assembler_.clear();

  lastEndedCallId_ = currentCallId_;
  currentCallId_.clear();
  phase_ = CallPhase::Ended;
}

void CallSessionOrchestrator::startPlaybackPump() {
  stopPlaybackPump();
  playbackRunning_ = true;
  playbackThread_ = std::thread(&CallSessionOrchestrator::playbackLoop, this);
}

void CallSessionOrchestrator::stopPlaybackPump() {
  playbackRunning_ = false;
  if (playbackThread_.joinable())
    playbackThread_.join();
}

void CallSessionOrchestrator::playbackLoop() {
  LOG_DEBUG("Playback pump started");
  while (playbackRunning_) {
    try {
      auto chunk = bridge_.takeForTelephony(std::chrono::milliseconds(100));
      if (chunk)
        assembler_.appendPlaybackAudio(*chunk);
    } catch (const std::exception &e) {
      LOG_ERROR("Playback pump error: " << e.what());
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
  LOG_DEBUG("Playback pump ended");
}
