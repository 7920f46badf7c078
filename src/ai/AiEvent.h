#pragma once

#include "../audio/AudioChunk.h"
#include "../tools/ToolRegistry.h"
#include <string>
#include <variant>

struct AudioEvent {
  AudioChunk pcm; // AI output rate
};

struct TextEvent {
  std::string text;
};

struct ToolCallEvent {
  std::string id;
  std::string name;
  ToolArgs args;
};

// Nothing for the call leg. `interrupted` is set when the caller talked over
// the model and queued playback has become stale.
struct EmptyEvent {
  bool interrupted = false;
};

using AiEvent = std::variant<AudioEvent, TextEvent, ToolCallEvent, EmptyEvent>;
