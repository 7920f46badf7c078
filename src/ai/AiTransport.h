#pragma once

#include "../audio/AudioChunk.h"
#include "AiEvent.h"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct AiSessionConfig {
  std::string model;
  std::string instructions;
  std::string voice;
  std::string greeting;
  int inputRate = 16000;
  int outputRate = 24000;
  std::vector<ToolDeclaration> tools;
};

struct ToolResult {
  std::string callId;
  std::string name;
  bool ok = true;
  std::string payload; // result text, or the error message when !ok
};

// Transient failure on an open session. The pumps log it and back off.
class AiTransportError : public std::runtime_error {
public:
  explicit AiTransportError(const std::string &what)
      : std::runtime_error(what) {}
};

// One open realtime session. send()/receive() may be used from two different
// threads at the same time.
class AiTransport {
public:
  virtual ~AiTransport() = default;

  virtual void send(const AudioChunk &pcm) = 0;
  virtual void sendText(const std::string &text) = 0;
  virtual void respondToTool(const ToolResult &result) = 0;

  // Blocks for the next event; std::nullopt once the stream is closed.
  virtual std::optional<AiEvent> receive() = 0;

  // Unblocks a pending receive(). Safe from any thread.
  virtual void cancel() = 0;
  virtual void close() = 0;
};

class AiConnector {
public:
  virtual ~AiConnector() = default;
  // nullptr when the session could not be opened.
  virtual std::unique_ptr<AiTransport> connect(const AiSessionConfig &config) = 0;
};
