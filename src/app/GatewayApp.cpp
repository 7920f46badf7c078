#include "GatewayApp.h"
#include "../ai/AiSessionController.h"
#include "../ai/GrpcAiTransport.h"
#include "../audio/DuplexAudioBridge.h"
#include "../audio/FrameAssembler.h"
#include "../call/CallSessionOrchestrator.h"
#include "../sip/SipUserAgent.h"
#include "../tools/ToolRegistry.h"
#include "../util/EventLoop.h"
#include "Logger.h"
#include "RegistrationSupervisor.h"

GatewayApp::GatewayApp(const Config &config) : config_(config) {
  BridgeConfig bridgeConfig;
  bridgeConfig.telephonyRate = config.audio.telephonyRate;
  bridgeConfig.aiInputRate = config.ai.inputRate;
  bridgeConfig.aiOutputRate = config.ai.outputRate;
  bridgeConfig.queueCapacity = config.audio.queueCapacity;

  loop_ = std::make_unique<EventLoop>();
  bridge_ = std::make_unique<DuplexAudioBridge>(bridgeConfig);
  assembler_ = std::make_unique<FrameAssembler>(
      *bridge_, config.audio.samplesPerFrame());

  tools_ = std::make_unique<ToolRegistry>();
  BuiltinTools::registerAll(*tools_);

  connector_ = std::make_unique<GrpcAiConnector>(
      config.ai.target, config.ai.apiKey, config.ai.connectTimeoutMs);

  AiSessionConfig sessionConfig;
  sessionConfig.model = config.ai.model;
  sessionConfig.instructions = config.ai.instructions;
  sessionConfig.voice = config.ai.voice;
  sessionConfig.greeting = config.ai.greeting;
  sessionConfig.inputRate = config.ai.inputRate;
  sessionConfig.outputRate = config.ai.outputRate;
  sessionConfig.tools = tools_->declarations();

  orchestrator_ = std::make_unique<CallSessionOrchestrator>(
      *loop_, *bridge_, *assembler_,
      [this, sessionConfig](AiSessionListener *listener)
          -> std::unique_ptr<AiSession> {
        return std::make_unique<AiSessionController>(
            *bridge_, *connector_, *tools_, sessionConfig, listener);
      },
      std::chrono::milliseconds(config.sip.autoAnswerDelayMs));

  supervisor_ = std::make_unique<RegistrationSupervisor>(
      config.supervisor,
      [this]() -> std::unique_ptr<TelephonyEngine> {
        return std::make_unique<SipUserAgent>(config_.sip, config_.rtp,
                                              config_.audio);
      },
      *orchestrator_, *assembler_);
}

GatewayApp::~GatewayApp() {
  // Engine first, then the orchestrator that receives its callbacks.
  supervisor_.reset();
  orchestrator_.reset();
  loop_->stop();
  bridge_->close();
}

bool GatewayApp::run() {
  LOG_INFO("Starting voice gateway\n" << config_.describe());
  LOG_INFO("Tools: " << tools_->declarations().size() << " registered");

  loop_->start();
  bool ok = supervisor_->run();

  LOG_INFO("Shutting down...");
  orchestrator_->shutdown();
  loop_->stop();
  bridge_->close();
  return ok;
}
