#pragma once

#include "AudioChunk.h"
#include <memory>
#include <optional>
#include <speex/speex_resampler.h>

struct SpeexResamplerDeleter {
  void operator()(SpeexResamplerState *st) const;
};

// Filter memory carried between chunks of one direction of one call. The
// handle is only valid for the rate pair and channel count it was built for.
struct ResamplerState {
  std::unique_ptr<SpeexResamplerState, SpeexResamplerDeleter> handle;
  int fromRate = 0;
  int toRate = 0;
  int channels = 0;

  bool matches(int from, int to, int ch) const {
    return handle && fromRate == from && toRate == to && channels == ch;
  }
};

struct ResampleResult {
  AudioChunk chunk;
  std::optional<ResamplerState> state;
};

// Stateful sample rate converter backed by the speexdsp resampler.
//
// Hand the returned state to the next call of the same stream; pass
// std::nullopt at the start of a stream. Equal rates and empty input return
// the chunk and the state untouched. Malformed input (unsupported width,
// misaligned length, non-positive rates) and resampler errors are logged and
// the audio is passed through unconverted.
class Resampler {
public:
  static constexpr int kQuality = SPEEX_RESAMPLER_QUALITY_VOIP;

  static ResampleResult convert(const AudioChunk &chunk,
                                std::optional<ResamplerState> state,
                                int fromRate, int toRate, int sampleWidth = 2,
                                int channels = 1);

private:
  static std::optional<ResamplerState> create(int fromRate, int toRate,
                                              int channels);
  static bool process(const AudioChunk &in, ResamplerState &state,
                      AudioChunk &out);
};
