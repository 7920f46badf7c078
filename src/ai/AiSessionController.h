#pragma once

#include "../audio/DuplexAudioBridge.h"
#include "../tools/ToolRegistry.h"
#include "AiSession.h"
#include "AiTransport.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

enum class AiSessionState { Idle, Starting, Active, Stopping };

const char *aiSessionStateName(AiSessionState state);

// Owns one realtime AI session for the duration of a call: an outbound pump
// (bridge -> transport) and an inbound pump (transport -> bridge, tools).
class AiSessionController : public AiSession {
public:
  AiSessionController(DuplexAudioBridge &bridge, AiConnector &connector,
                      const ToolRegistry &tools, AiSessionConfig config,
                      AiSessionListener *listener = nullptr);
  ~AiSessionController() override;

  AiSessionController(const AiSessionController &) = delete;
  AiSessionController &operator=(const AiSessionController &) = delete;

  // No-op with a warning unless Idle.
  bool start() override;
  // No-op when Idle.
  void stop() override;
  bool isActive() const override;

  AiSessionState state() const;

  uint64_t chunksSent() const { return chunksSent_; }
  uint64_t chunksReceived() const { return chunksReceived_; }

  static constexpr std::chrono::milliseconds kPollTimeout{100};
  static constexpr std::chrono::milliseconds kBackoff{100};

private:
  void outboundLoop();
  void inboundLoop();
  void handleEvent(const AiEvent &event);
  void dispatchTool(const ToolCallEvent &call);
  // Returns false if the session is being stopped.
  bool backoff();
  void setState(AiSessionState state);

  DuplexAudioBridge &bridge_;
  AiConnector &connector_;
  const ToolRegistry &tools_;
  const AiSessionConfig config_;
  AiSessionListener *listener_;

  std::mutex lifecycleMutex_; // serializes start() and stop()
  mutable std::mutex stateMutex_;
  AiSessionState state_ = AiSessionState::Idle;

  std::unique_ptr<AiTransport> transport_;
  std::atomic<bool> running_{false};
  std::mutex wakeMutex_;
  std::condition_variable wakeCv_;
  std::thread outboundThread_;
  std::thread inboundThread_;

  std::atomic<uint64_t> chunksSent_{0};
  std::atomic<uint64_t> chunksReceived_{0};
};
