#include <catch2/catch.hpp>

#include "TestHelpers.h"
#include "audio/FrameAssembler.h"
#include <algorithm>

using TestHelpers::pcm;

TEST_CASE("Frame assembler plays silence when nothing is buffered",
          "[assembler]") {
  DuplexAudioBridge bridge(BridgeConfig{});
  FrameAssembler assembler(bridge, 160);

  REQUIRE(assembler.frameBytes() == 320);
  AudioChunk frame = assembler.requestFrame();
  REQUIRE(frame.size() == 320);
  REQUIRE(std::all_of(frame.begin(), frame.end(), [](char c) { return c == 0; }));
}

TEST_CASE("Frame assembler returns exact frames and keeps the residue",
          "[assembler]") {
  DuplexAudioBridge bridge(BridgeConfig{});
  FrameAssembler assembler(bridge, 160);

  AudioChunk first = pcm(100, 1);
  AudioChunk second = pcm(150, 2);
  assembler.appendPlaybackAudio(first);
  assembler.appendPlaybackAudio(second);
  REQUIRE(assembler.bufferedBytes() == 500);

  AudioChunk frame = assembler.requestFrame();
  REQUIRE(frame.size() == 320);
  CHECK(Pcm16::sampleAt(frame, 0) == 1);
  CHECK(Pcm16::sampleAt(frame, 99) == 1);
  CHECK(Pcm16::sampleAt(frame, 100) == 2);
  CHECK(Pcm16::sampleAt(frame, 159) == 2);
  REQUIRE(assembler.bufferedBytes() == 180);

  // Not enough for a frame: silence, residue untouched.
  AudioChunk silence = assembler.requestFrame();
  REQUIRE(silence == AudioChunk(320, 0));
  REQUIRE(assembler.bufferedBytes() == 180);

  assembler.appendPlaybackAudio(pcm(70, 3));
  frame = assembler.requestFrame();
  CHECK(Pcm16::sampleAt(frame, 0) == 2);
  CHECK(Pcm16::sampleAt(frame, 89) == 2);
  CHECK(Pcm16::sampleAt(frame, 90) == 3);
  REQUIRE(assembler.bufferedBytes() == 0);
}

TEST_CASE("Clearing the assembler drops pending playback", "[assembler]") {
  DuplexAudioBridge bridge(BridgeConfig{});
  FrameAssembler assembler(bridge, 160);
  assembler.appendPlaybackAudio(pcm(400));
  assembler.clear();
  REQUIRE(assembler.bufferedBytes() == 0);
  REQUIRE(assembler.requestFrame() == AudioChunk(320, 0));
}

TEST_CASE("Captured frames are forwarded to the bridge", "[assembler]") {
  DuplexAudioBridge bridge(BridgeConfig{});
  FrameAssembler assembler(bridge, 160);
  assembler.onFrameReceived(pcm(160));
  REQUIRE(bridge.pendingForAi() == 1);
}
