#include "DuplexAudioBridge.h"
#include "../app/Logger.h"

DuplexAudioBridge::DuplexAudioBridge(const BridgeConfig &config)
    : config_(config), toAiDir_(config.queueCapacity),
      toTelephonyDir_(config.queueCapacity), toAi_(toAiDir_.queue),
      toTelephony_(toTelephonyDir_.queue) {
  LOG_INFO("AudioBridge initialized: telephony@" << config_.telephonyRate
           << "Hz <-> AI@" << config_.aiInputRate << "Hz/"
           << config_.aiOutputRate << "Hz, queue capacity "
           << config_.queueCapacity);
}

bool DuplexAudioBridge::submitFromTelephony(const AudioChunk &chunk) {
  return submit(toAiDir_, chunk, config_.telephonyRate, config_.aiInputRate,
                "telephony->AI");
}

bool DuplexAudioBridge::submitFromAi(const AudioChunk &chunk) {
  return submit(toTelephonyDir_, chunk, config_.aiOutputRate,
                config_.telephonyRate, "AI->telephony");
}

bool DuplexAudioBridge::submit(Direction &dir, const AudioChunk &chunk,
                               int fromRate, int toRate, const char *label) {
  if (chunk.empty())
    return true;

  AudioChunk converted;
  {
    // Only contended by resetForNewCall(); each direction has one producer.
    std::lock_guard<std::mutex> lock(dir.stateMutex);
    auto result = Resampler::convert(chunk, std::move(dir.state), fromRate,
                                     toRate, config_.sampleWidth,
                                     config_.channels);
    dir.state = std::move(result.state);
    converted = std::move(result.chunk);
  }

  if (!dir.queue.tryPush(std::move(converted))) {
    LOG_WARN(label << " queue full, dropping audio frame (dropped so far: "
                   << dir.queue.dropped() << ")");
    return false;
  }
  return true;
}

std::optional<AudioChunk> DuplexAudioBridge::takeForAi() { return toAi_.pop(); }

std::optional<AudioChunk>
DuplexAudioBridge::takeForAi(std::chrono::milliseconds timeout) {
  return toAi_.popFor(timeout);
}

std::optional<AudioChunk> DuplexAudioBridge::takeForTelephony() {
  return toTelephony_.pop();
}

std::optional<AudioChunk>
DuplexAudioBridge::takeForTelephony(std::chrono::milliseconds timeout) {
  return toTelephony_.popFor(timeout);
}

std::optional<AudioChunk> DuplexAudioBridge::tryTakeForTelephony() {
  return toTelephony_.tryPop();
}

void DuplexAudioBridge::resetForNewCall() {
  {
    std::lock_guard<std::mutex> lock(toAiDir_.stateMutex);
    toAiDir_.state.reset();
  }
  {
    std::lock_guard<std::mutex> lock(toTelephonyDir_.stateMutex);
    toTelephonyDir_.state.reset();
  }
  size_t a = toAi_.clear();
  size_t b = toTelephony_.clear();
  LOG_DEBUG("AudioBridge state reset (discarded " << a << " + " << b
            << " chunks)");
}

size_t DuplexAudioBridge::flushTelephonyQueue() { return toTelephony_.clear(); }

void DuplexAudioBridge::close() {
  toAi_.close();
  toTelephony_.close();
}
