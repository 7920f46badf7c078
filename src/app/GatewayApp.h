#pragma once

#include "Config.h"
#include <memory>

class EventLoop;
class DuplexAudioBridge;
class FrameAssembler;
class ToolRegistry;
class AiConnector;
class CallSessionOrchestrator;
class RegistrationSupervisor;

// Owns every long-lived component and wires them together. run() blocks
// until a signal arrives or the registration retry budget is spent.
class GatewayApp {
public:
  explicit GatewayApp(const Config &config);
  ~GatewayApp();

  GatewayApp(const GatewayApp &) = delete;
  GatewayApp &operator=(const GatewayApp &) = delete;

  bool run();

private:
  const Config &config_;

  std::unique_ptr<EventLoop> loop_;
  std::unique_ptr<DuplexAudioBridge> bridge_;
  std::unique_ptr<FrameAssembler> assembler_;
  std::unique_ptr<ToolRegistry> tools_;
  std::unique_ptr<AiConnector> connector_;
  std::unique_ptr<CallSessionOrchestrator> orchestrator_;
  std::unique_ptr<RegistrationSupervisor> supervisor_;
};
