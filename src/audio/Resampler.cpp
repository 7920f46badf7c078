#include "Resampler.h"
#include "../app/Logger.h"
#include <vector>

void SpeexResamplerDeleter::operator()(SpeexResamplerState *st) const {
  speex_resampler_destroy(st);
}

ResampleResult Resampler::convert(const AudioChunk &chunk,
                                  std::optional<ResamplerState> state,
                                  int fromRate, int toRate, int sampleWidth,
                                  int channels) {
  if (chunk.empty())
    return {AudioChunk{}, std::move(state)};

  if (fromRate == toRate)
    return {chunk, std::move(state)};

  if (sampleWidth != 2 || channels <= 0 || fromRate <= 0 || toRate <= 0) {
    LOG_ERROR("Resampler: unsupported format width=" << sampleWidth
              << " channels=" << channels << " rates=" << fromRate << "->"
              << toRate << ", passing audio through");
    return {chunk, std::move(state)};
  }

  size_t frameBytes = static_cast<size_t>(sampleWidth) * channels;
  if (chunk.size() % frameBytes != 0) {
    LOG_ERROR("Resampler: chunk of " << chunk.size()
              << " bytes is not a whole number of frames, passing audio through");
    return {chunk, std::move(state)};
  }

  if (!state || !state->matches(fromRate, toRate, channels)) {
    if (state)
      LOG_WARN("Resampler: stream format changed to " << fromRate << "->"
               << toRate << "Hz x" << channels << ", restarting filter");
    auto fresh = create(fromRate, toRate, channels);
    if (!fresh)
      return {chunk, std::move(state)};
    state = std::move(fresh);
  }

  AudioChunk out;
  if (!process(chunk, *state, out)) {
    LOG_ERROR("Resampler: conversion " << fromRate << "->" << toRate
              << " failed, passing audio through");
    return {chunk, std::move(state)};
  }
  return {std::move(out), std::move(state)};
}

std::optional<ResamplerState> Resampler::create(int fromRate, int toRate,
                                                int channels) {
  int err = RESAMPLER_ERR_SUCCESS;
  SpeexResamplerState *st = speex_resampler_init(
      static_cast<spx_uint32_t>(channels), static_cast<spx_uint32_t>(fromRate),
      static_cast<spx_uint32_t>(toRate), kQuality, &err);
  if (err != RESAMPLER_ERR_SUCCESS || !st) {
    LOG_ERROR("Resampler: init " << fromRate << "->" << toRate
              << " failed: " << speex_resampler_strerror(err));
    if (st)
      speex_resampler_destroy(st);
    return std::nullopt;
  }

  std::optional<ResamplerState> state(std::in_place);
  state->handle.reset(st);
  state->fromRate = fromRate;
  state->toRate = toRate;
  state->channels = channels;
  LOG_DEBUG("Resampler: created " << fromRate << "->" << toRate << "Hz x"
            << channels);
  return state;
}

bool Resampler::process(const AudioChunk &in, ResamplerState &state,
                        AudioChunk &out) {
  size_t samples = Pcm16::sampleCount(in);
  std::vector<spx_int16_t> input(samples);
  for (size_t i = 0; i < samples; ++i)
    input[i] = Pcm16::sampleAt(in, i);

  size_t frames = samples / state.channels;
  // Room for the whole chunk plus the fractional carry from earlier chunks.
  size_t capacity = static_cast<size_t>(static_cast<uint64_t>(frames) *
                                        state.toRate / state.fromRate) +
                    16;
  std::vector<spx_int16_t> output(capacity * state.channels);

  spx_uint32_t inLen = static_cast<spx_uint32_t>(frames);
  spx_uint32_t outLen = static_cast<spx_uint32_t>(capacity);
  int err;
  if (state.channels == 1)
    err = speex_resampler_process_int(state.handle.get(), 0, input.data(),
                                      &inLen, output.data(), &outLen);
  else
    err = speex_resampler_process_interleaved_int(
        state.handle.get(), input.data(), &inLen, output.data(), &outLen);

  if (err != RESAMPLER_ERR_SUCCESS) {
    LOG_ERROR("Resampler: " << speex_resampler_strerror(err));
    return false;
  }
  if (inLen != frames)
    LOG_WARN("Resampler: consumed " << inLen << " of " << frames
             << " input frames");

  size_t produced = static_cast<size_t>(outLen) * state.channels;
  out.reserve(produced * 2);
  for (size_t i = 0; i < produced; ++i)
    Pcm16::append(out, output[i]);
  return true;
}
