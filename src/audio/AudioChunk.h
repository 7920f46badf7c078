#pragma once

#include <cstdint>
#include <cstring>
#include <vector>

// Raw 16-bit little-endian linear PCM, mono unless stated otherwise. The
// sample rate is implied by the leg the chunk travels on.
using AudioChunk = std::vector<char>;

namespace Pcm16 {

inline size_t sampleCount(const AudioChunk &chunk) { return chunk.size() / 2; }

inline int16_t sampleAt(const AudioChunk &chunk, size_t index) {
  uint16_t lo = static_cast<uint8_t>(chunk[index * 2]);
  uint16_t hi = static_cast<uint8_t>(chunk[index * 2 + 1]);
  return static_cast<int16_t>(lo | (hi << 8));
}

inline void append(AudioChunk &chunk, int16_t sample) {
  uint16_t u = static_cast<uint16_t>(sample);
  chunk.push_back(static_cast<char>(u & 0xFF));
  chunk.push_back(static_cast<char>((u >> 8) & 0xFF));
}

} // namespace Pcm16
