#include "AiSessionController.h"
#include "../app/Logger.h"

constexpr std::chrono::milliseconds AiSessionController::kPollTimeout;
constexpr std::chrono::milliseconds AiSessionController::kBackoff;

const char *aiSessionStateName(AiSessionState state) {
  switch (state) {
  case AiSessionState::Idle:
    return "Idle";
  case AiSessionState::Starting:
    return "Starting";
  case AiSessionState::Active:
    return "Active";
  case AiSessionState::Stopping:
    return "Stopping";
  }
  return "Unknown";
}

AiSessionController::AiSessionController(DuplexAudioBridge &bridge,
                                         AiConnector &connector,
                                         const ToolRegistry &tools,
                                         AiSessionConfig config,
                                         AiSessionListener *listener)
    : bridge_(bridge), connector_(connector), tools_(tools),
      config_(std::move(config)), listener_(listener) {}

AiSessionController::~AiSessionController() { stop(); }

AiSessionState AiSessionController::state() const {
  std::lock_guard<std::mutex> lock(stateMutex_);
  return state_;
}

bool AiSessionController::isActive() const {
  return state() == AiSessionState::Active;
}

void AiSessionController::setState(AiSessionState state) {
  std::lock_guard<std::mutex> lock(stateMutex_);
  state_ = state;
}

bool AiSessionController::start() {
  std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
  {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (state_ != AiSessionState::Idle) {
      LOG_WARN("AI session already " << aiSessionStateName(state_)
                                     << ", ignoring start");
      return false;
    }
    state_ = AiSessionState::Starting;
  }

  LOG_INFO("Starting AI session (model " << config_.model << ", voice "
                                         << config_.voice << ")");
  auto transport = connector_.connect(config_);
  if (!transport) {
    LOG_ERROR("Failed to open AI session");
    setState(AiSessionState::Idle);
    return false;
  }

  if (!config_.greeting.empty()) {
    try {
      transport->sendText(config_.greeting);
      LOG_INFO("Sent initial greeting prompt");
    } catch (const AiTransportError &e) {
      LOG_WARN("Failed to send greeting prompt: " << e.what());
    }
  }

  transport_ = std::move(transport);
  running_ = true;
  setState(AiSessionState::Active);

  outboundThread_ = std::thread(&AiSessionController::outboundLoop, this);
  inboundThread_ = std::thread(&AiSessionController::inboundLoop, this);
  LOG_INFO("AI session active");
  return true;
}

void AiSessionController::stop() {
  std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
  {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (state_ == AiSessionState::Idle)
      return;
    state_ = AiSessionState::Stopping;
  }

  {
    std::lock_guard<std::mutex> lock(wakeMutex_);
    running_ = false;
  }
  wakeCv_.notify_all();

  if (transport_)
    transport_->cancel();
  if (outboundThread_.joinable())
    outboundThread_.join();
  if (inboundThread_.joinable())
    inboundThread_.join();

  if (transport_) {
    transport_->close();
    transport_.reset();
  }

  setState(AiSessionState::Idle);
  LOG_INFO("AI session stopped (sent " << chunksSent_ << " chunks, received "
                                       << chunksReceived_ << ")");
}

bool AiSessionController::backoff() {
  std::unique_lock<std::mutex> lock(wakeMutex_);
  return !wakeCv_.wait_for(lock, kBackoff, [this] { return !running_; });
}

void AiSessionController::outboundLoop() {
  LOG_DEBUG("AI outbound pump started");
  while (running_) {
    auto chunk = bridge_.takeForAi(kPollTimeout);
    if (!chunk)
      continue; // idle line

    try {
      transport_->send(*chunk);
      chunksSent_++;
    } catch (const std::exception &e) {
      if (!running_)
        break;
      LOG_ERROR("Error sending audio to AI: " << e.what());
      if (!backoff())
        break;
    }
  }
  LOG_DEBUG("AI outbound pump ended");
}

void AiSessionController::inboundLoop() {
  LOG_DEBUG("AI inbound pump started");
  while (running_) {
    try {
      auto event = transport_->receive();
      if (!event) {
        if (!running_)
          break;
        LOG_WARN("AI session closed by remote");
        {
          std::lock_guard<std::mutex> lock(wakeMutex_);
          running_ = false;
        }
        wakeCv_.notify_all();
        setState(AiSessionState::Stopping);
        if (listener_)
          listener_->onAiSessionEnded();
        break;
      }
      handleEvent(*event);
    } catch (const std::exception &e) {
      if (!running_)
        break;
      LOG_ERROR("Error receiving from AI: " << e.what());
      if (!backoff())
        break;
    }
  }
  LOG_DEBUG("AI inbound pump ended");
}

void AiSessionController::handleEvent(const AiEvent &event) {
  if (auto audio = std::get_if<AudioEvent>(&event)) {
    if (audio->pcm.empty())
      return;
    chunksReceived_++;
    LOG_DEBUG("Received " << audio->pcm.size() << " bytes of audio from AI");
    bridge_.submitFromAi(audio->pcm);
  } else if (auto text = std::get_if<TextEvent>(&event)) {
    LOG_INFO("AI text: " << text->text);
    if (listener_)
      listener_->onAiText(text->text);
  } else if (auto call = std::get_if<ToolCallEvent>(&event)) {
    dispatchTool(*call);
  } else if (auto empty = std::get_if<EmptyEvent>(&event)) {
    if (empty->interrupted) {
      LOG_INFO("Caller interrupted the AI, discarding pending playback");
      if (listener_)
        listener_->onAiInterrupted();
    }
  }
}

void AiSessionController::dispatchTool(const ToolCallEvent &call) {
  LOG_INFO("AI requested tool call: " << call.name);

  ToolResult result;
  result.callId = call.id;
  result.name = call.name;
  try {
    result.payload = tools_.execute(call.name, call.args);
  } catch (const ToolError &e) {
    LOG_ERROR("Tool execution error: " << e.what());
    result.ok = false;
    result.payload = e.what();
  }

  transport_->respondToTool(result);
  LOG_INFO("Tool " << call.name << (result.ok ? " result" : " error")
                   << " sent to AI: " << result.payload);
}
