#pragma once

#include "../audio/AudioChunk.h"
#include <string>

enum class CallState { Ringing, MediaActive, Ended };

inline const char *callStateName(CallState state) {
  switch (state) {
  case CallState::Ringing:
    return "Ringing";
  case CallState::MediaActive:
    return "MediaActive";
  case CallState::Ended:
    return "Ended";
  }
  return "Unknown";
}

struct CallEvent {
  std::string callId;
  CallState state;
  std::string remoteUri;
};

// Audio endpoint of the call leg. The engine pushes decoded frames in and
// pulls exactly one frame out per packetization interval.
class MediaPort {
public:
  virtual ~MediaPort() = default;
  virtual void onFrameReceived(const AudioChunk &frame) = 0;
  virtual AudioChunk requestFrame() = 0;
};

// Fired from the engine's own threads. Implementations must return quickly.
class TelephonyListener {
public:
  virtual ~TelephonyListener() = default;
  virtual void onRegistrationState(bool registered, int code,
                                   const std::string &reason) = 0;
  virtual void onCallState(const CallEvent &event) = 0;
};

class TelephonyEngine {
public:
  virtual ~TelephonyEngine() = default;

  // Opens the transport and begins registration; the outcome arrives via
  // TelephonyListener::onRegistrationState.
  virtual bool start(TelephonyListener *listener, MediaPort *media) = 0;
  virtual void stop() = 0;
  virtual bool isRegistered() const = 0;

  virtual bool answer(const std::string &callId, int statusCode = 200) = 0;
  virtual bool hangup(const std::string &callId) = 0;
};
