#pragma once

#include "audio/AudioChunk.h"
#include <algorithm>
#include <cstdlib>
#include <chrono>
#include <cmath>
#include <functional>
#include <thread>

namespace TestHelpers {

// Polls `condition` until it holds or `timeout` passes.
inline bool waitUntil(const std::function<bool()> &condition,
                      std::chrono::milliseconds timeout =
                          std::chrono::milliseconds(2000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return condition();
}

// `samples` mono PCM16 samples of a constant value.
inline AudioChunk pcm(size_t samples, int16_t value = 256) {
  AudioChunk chunk;
  chunk.reserve(samples * 2);
  for (size_t i = 0; i < samples; ++i)
    Pcm16::append(chunk, value);
  return chunk;
}

constexpr double kPi = 3.14159265358979323846;

// Mono sine tone; `offset` continues the phase of an earlier chunk.
inline AudioChunk tone(size_t samples, int rate, double hz, int16_t amplitude,
                       size_t offset = 0) {
  AudioChunk chunk;
  chunk.reserve(samples * 2);
  for (size_t i = 0; i < samples; ++i) {
    double t = static_cast<double>(offset + i) / rate;
    Pcm16::append(chunk, static_cast<int16_t>(amplitude *
                                              std::sin(2 * kPi * hz * t)));
  }
  return chunk;
}

inline int peak(const AudioChunk &chunk) {
  int best = 0;
  for (size_t i = 0; i < Pcm16::sampleCount(chunk); ++i)
    best = std::max(best, std::abs(static_cast<int>(Pcm16::sampleAt(chunk, i))));
  return best;
}

} // namespace TestHelpers
