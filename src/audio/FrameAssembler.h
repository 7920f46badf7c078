#pragma once

#include "../telephony/TelephonyEngine.h"
#include "DuplexAudioBridge.h"
#include <deque>
#include <mutex>

// Adapts the bridge's variable-size chunks to the call leg's fixed frames.
class FrameAssembler : public MediaPort {
public:
  FrameAssembler(DuplexAudioBridge &bridge, int samplesPerFrame,
                 int bytesPerSample = 2);

  // Capture path, forwarded unmodified.
  void onFrameReceived(const AudioChunk &frame) override;

  // One FIFO frame when enough is buffered, otherwise silence of the same
  // size. Partial residue stays buffered.
  AudioChunk requestFrame() override;

  void appendPlaybackAudio(const AudioChunk &chunk);
  void clear();

  size_t bufferedBytes() const;
  size_t frameBytes() const { return frameBytes_; }

private:
  DuplexAudioBridge &bridge_;
  const size_t frameBytes_;

  mutable std::mutex mutex_;
  std::deque<char> playbackBuffer_;
};
