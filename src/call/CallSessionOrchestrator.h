#pragma once

#include "../ai/AiSession.h"
#include "../audio/DuplexAudioBridge.h"
#include "../audio/FrameAssembler.h"
#include "../telephony/TelephonyEngine.h"
#include "../util/EventLoop.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

enum class CallPhase { NoCall, Ringing, MediaActive, Ended };

const char *callPhaseName(CallPhase phase);

// Glues call-state notifications from the telephony engine to the AI
// session lifecycle. Engine callbacks only post work to the EventLoop; all
// orchestrator state below is touched on the loop thread alone.
class CallSessionOrchestrator : public TelephonyListener,
                                public AiSessionListener {
public:
  using SessionFactory =
      std::function<std::unique_ptr<AiSession>(AiSessionListener *)>;

  CallSessionOrchestrator(EventLoop &loop, DuplexAudioBridge &bridge,
                          FrameAssembler &assembler, SessionFactory factory,
                          std::chrono::milliseconds autoAnswerDelay);
  ~CallSessionOrchestrator() override;

  // Engine used for auto-answer. Both block until the loop has applied
  // the change; detaching ends any call in progress.
  void attachEngine(TelephonyEngine *engine);
  void detachEngine();

  // Ends the current call, if any, and waits for the teardown.
  void shutdown();

  // TelephonyListener (engine threads)
  void onRegistrationState(bool registered, int code,
                           const std::string &reason) override;
  void onCallState(const CallEvent &event) override;

  // AiSessionListener (pump threads)
  void onAiInterrupted() override;
  void onAiSessionEnded() override;

  // Loop-thread snapshot, for tests and status logs.
  CallPhase phase() const { return phase_; }
  const std::string &currentCallId() const { return currentCallId_; }
  bool hasSession() const { return session_ != nullptr; }

private:
  void handleCallEvent(const CallEvent &event);
  void onRinging(const CallEvent &event);
  void onMediaActive(const CallEvent &event);
  void onEnded(const CallEvent &event);
  void autoAnswer(const std::string &callId);

  void beginMedia(const std::string &callId);
  void endCall(const std::string &reason);

  void startPlaybackPump();
  void stopPlaybackPump();
  void playbackLoop();

  EventLoop &loop_;
  DuplexAudioBridge &bridge_;
  FrameAssembler &assembler_;
  SessionFactory factory_;
  std::chrono::milliseconds autoAnswerDelay_;

  TelephonyEngine *engine_ = nullptr;
  CallPhase phase_ = CallPhase::NoCall;
  std::string currentCallId_;
  std::string lastEndedCallId_;
  std::unique_ptr<AiSession> session_;

  std::atomic<bool> playbackRunning_{false};
  std::thread playbackThread_;
};
