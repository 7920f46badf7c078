#include "FrameAssembler.h"
#include "../app/Logger.h"

FrameAssembler::FrameAssembler(DuplexAudioBridge &bridge, int samplesPerFrame,
                               int bytesPerSample)
    : bridge_(bridge),
      frameBytes_(static_cast<size_t>(samplesPerFrame) * bytesPerSample) {}

void FrameAssembler::onFrameReceived(const AudioChunk &frame) {
  bridge_.submitFromTelephony(frame);
}

AudioChunk FrameAssembler::requestFrame() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (playbackBuffer_.size() < frameBytes_)
    return AudioChunk(frameBytes_, 0);

  AudioChunk frame(playbackBuffer_.begin(),
                   playbackBuffer_.begin() + frameBytes_);
  playbackBuffer_.erase(playbackBuffer_.begin(),
                        playbackBuffer_.begin() + frameBytes_);
  return frame;
}

void FrameAssembler::appendPlaybackAudio(const AudioChunk &chunk) {
  if (chunk.empty())
    return;
  std::lock_guard<std::mutex> lock(mutex_);
  playbackBuffer_.insert(playbackBuffer_.end(), chunk.begin(), chunk.end());
}

void FrameAssembler::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!playbackBuffer_.empty())
    LOG_DEBUG("Discarding " << playbackBuffer_.size() << " playback bytes");
  playbackBuffer_.clear();
}

size_t FrameAssembler::bufferedBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return playbackBuffer_.size();
}
