#include <catch2/catch.hpp>

#include "TestHelpers.h"
#include "audio/DuplexAudioBridge.h"
#include "util/BoundedQueue.h"
#include <thread>

using namespace std::chrono_literals;
using TestHelpers::pcm;
using TestHelpers::tone;

TEST_CASE("BoundedQueue is FIFO and refuses the newest item when full",
          "[queue]") {
  BoundedQueue<int> queue(3);
  REQUIRE(queue.tryPush(1));
  REQUIRE(queue.tryPush(2));
  REQUIRE(queue.tryPush(3));
  REQUIRE_FALSE(queue.tryPush(4));
  REQUIRE(queue.dropped() == 1);
  REQUIRE(queue.size() == 3);

  REQUIRE(*queue.tryPop() == 1);
  REQUIRE(*queue.pop() == 2);
  REQUIRE(*queue.popFor(10ms) == 3);
  REQUIRE_FALSE(queue.tryPop().has_value());
}

TEST_CASE("BoundedQueue timed pop gives up on an idle queue", "[queue]") {
  BoundedQueue<int> queue(2);
  auto start = std::chrono::steady_clock::now();
  REQUIRE_FALSE(queue.popFor(30ms).has_value());
  REQUIRE(std::chrono::steady_clock::now() - start >= 25ms);
}

TEST_CASE("BoundedQueue close wakes a blocked consumer", "[queue]") {
  BoundedQueue<int> queue(2);
  std::optional<int> result = 42;
  std::thread consumer([&] { result = queue.pop(); });
  std::this_thread::sleep_for(20ms);
  queue.close();
  consumer.join();
  REQUIRE_FALSE(result.has_value());
  REQUIRE_FALSE(queue.tryPush(1));
}

TEST_CASE("BoundedQueue clear reports what it discarded", "[queue]") {
  BoundedQueue<int> queue(5);
  queue.tryPush(1);
  queue.tryPush(2);
  REQUIRE(queue.clear() == 2);
  REQUIRE(queue.size() == 0);
}

TEST_CASE("Ten telephony frames reach the AI side in order", "[bridge]") {
  DuplexAudioBridge bridge(BridgeConfig{});

  // Frame lengths differ so the order survives resampling.
  for (size_t i = 0; i < 10; ++i)
    REQUIRE(bridge.submitFromTelephony(pcm(80 + 8 * i)));
  REQUIRE(bridge.pendingForAi() == 10);

  for (size_t i = 0; i < 10; ++i) {
    auto chunk = bridge.takeForAi(100ms);
    REQUIRE(chunk.has_value());
    CHECK(chunk->size() == (80 + 8 * i) * 4);
  }
  REQUIRE_FALSE(bridge.takeForAi(10ms).has_value());
}

TEST_CASE("AI audio is converted to the telephony rate", "[bridge]") {
  DuplexAudioBridge bridge(BridgeConfig{});
  REQUIRE(bridge.submitFromAi(pcm(480)));
  auto chunk = bridge.tryTakeForTelephony();
  REQUIRE(chunk.has_value());
  REQUIRE(chunk->size() == 320);
}

TEST_CASE("A full direction drops the newest chunk", "[bridge]") {
  DuplexAudioBridge bridge(BridgeConfig{});
  for (int i = 0; i < 100; ++i)
    REQUIRE(bridge.submitFromTelephony(pcm(160)));
  REQUIRE_FALSE(bridge.submitFromTelephony(pcm(160)));
  REQUIRE(bridge.pendingForAi() == 100);
  REQUIRE(bridge.droppedToAi() == 1);
  REQUIRE(bridge.droppedToTelephony() == 0);
}

TEST_CASE("Empty chunks are ignored", "[bridge]") {
  DuplexAudioBridge bridge(BridgeConfig{});
  REQUIRE(bridge.submitFromTelephony(AudioChunk{}));
  REQUIRE(bridge.submitFromAi(AudioChunk{}));
  REQUIRE(bridge.pendingForAi() == 0);
  REQUIRE(bridge.pendingForTelephony() == 0);
}

TEST_CASE("Reset for a new call drains queues and restarts the filters",
          "[bridge]") {
  DuplexAudioBridge bridge(BridgeConfig{});
  bridge.submitFromTelephony(tone(160, 8000, 700, 6000));
  bridge.submitFromTelephony(tone(160, 8000, 700, 6000, 160));
  bridge.submitFromAi(tone(480, 24000, 700, 6000));

  bridge.resetForNewCall();
  REQUIRE(bridge.pendingForAi() == 0);
  REQUIRE(bridge.pendingForTelephony() == 0);

  DuplexAudioBridge fresh(BridgeConfig{});
  AudioChunk caller = tone(160, 8000, 300, 4000);
  AudioChunk reply = tone(480, 24000, 300, 4000);

  bridge.submitFromTelephony(caller);
  fresh.submitFromTelephony(caller);
  auto reused = bridge.takeForAi(100ms);
  auto expected = fresh.takeForAi(100ms);
  REQUIRE(reused.has_value());
  REQUIRE(expected.has_value());
  REQUIRE(*reused == *expected);

  bridge.submitFromAi(reply);
  fresh.submitFromAi(reply);
  auto played = bridge.tryTakeForTelephony();
  auto expectedPlayed = fresh.tryTakeForTelephony();
  REQUIRE(played.has_value());
  REQUIRE(expectedPlayed.has_value());
  REQUIRE(*played == *expectedPlayed);
}

TEST_CASE("Barge-in flush only touches the playback direction", "[bridge]") {
  DuplexAudioBridge bridge(BridgeConfig{});
  bridge.submitFromTelephony(pcm(160));
  bridge.submitFromAi(pcm(480));
  bridge.submitFromAi(pcm(480));

  REQUIRE(bridge.flushTelephonyQueue() == 2);
  REQUIRE(bridge.pendingForTelephony() == 0);
  REQUIRE(bridge.pendingForAi() == 1);
}

TEST_CASE("Closing the bridge releases blocked consumers", "[bridge]") {
  DuplexAudioBridge bridge(BridgeConfig{});
  std::optional<AudioChunk> result = AudioChunk{1};
  std::thread consumer([&] { result = bridge.takeForAi(); });
  std::this_thread::sleep_for(20ms);
  bridge.close();
  consumer.join();
  REQUIRE_FALSE(result.has_value());
}
