#pragma once

#include <string>

// Notifications from a running session. Called on the session's pump
// threads.
class AiSessionListener {
public:
  virtual ~AiSessionListener() = default;
  virtual void onAiText(const std::string &text) {}
  virtual void onAiInterrupted() {}
  // The remote side closed the stream; stop() still has to be called.
  virtual void onAiSessionEnded() {}
};

class AiSession {
public:
  virtual ~AiSession() = default;
  virtual bool start() = 0;
  virtual void stop() = 0;
  virtual bool isActive() const = 0;
};
