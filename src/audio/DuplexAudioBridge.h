#pragma once

#include "../util/BoundedQueue.h"
#include "AudioChunk.h"
#include "Resampler.h"
#include <chrono>
#include <mutex>
#include <optional>

struct BridgeConfig {
  int telephonyRate = 8000;
  int aiInputRate = 16000;
  int aiOutputRate = 24000;
  int sampleWidth = 2;
  int channels = 1;
  size_t queueCapacity = 100;
};

// Moves audio between the telephony leg and the AI session. Each direction
// owns a resampler state and a bounded queue; producers never block and
// consumers suspend on the queue.
class DuplexAudioBridge {
public:
  explicit DuplexAudioBridge(const BridgeConfig &config);

  // Telephony -> AI. Called from the media thread; drops when full.
  bool submitFromTelephony(const AudioChunk &chunk);
  // AI -> telephony. Called from the AI inbound pump; drops when full.
  bool submitFromAi(const AudioChunk &chunk);

  std::optional<AudioChunk> takeForAi();
  std::optional<AudioChunk> takeForAi(std::chrono::milliseconds timeout);
  std::optional<AudioChunk> takeForTelephony();
  std::optional<AudioChunk> takeForTelephony(std::chrono::milliseconds timeout);
  std::optional<AudioChunk> tryTakeForTelephony();

  // Discards both resampler states and drains both queues.
  void resetForNewCall();

  // Drops queued AI output only (caller barge-in).
  size_t flushTelephonyQueue();

  // Releases blocked consumers for good; used on shutdown.
  void close();

  size_t pendingForAi() const { return toAi_.size(); }
  size_t pendingForTelephony() const { return toTelephony_.size(); }
  uint64_t droppedToAi() const { return toAi_.dropped(); }
  uint64_t droppedToTelephony() const { return toTelephony_.dropped(); }

  const BridgeConfig &config() const { return config_; }

private:
  struct Direction {
    Direction(size_t capacity) : queue(capacity) {}
    BoundedQueue<AudioChunk> queue;
    std::mutex stateMutex;
    std::optional<ResamplerState> state;
  };

  bool submit(Direction &dir, const AudioChunk &chunk, int fromRate,
              int toRate, const char *label);

  const BridgeConfig config_;
  Direction toAiDir_;
  Direction toTelephonyDir_;
  BoundedQueue<AudioChunk> &toAi_;
  BoundedQueue<AudioChunk> &toTelephony_;
};
