#pragma once

#include <SDL3/SDL_audio.h>

#include <cstdint>
#include <string>

#include "ecs/Events.h"

class World;

// Plays short WAV cues in response to movement events. Subscribes to the world's dispatcher;
// the simulation never calls into audio directly.
class AudioCues {
 public:
  bool init(const std::string& audioDir);
  void shutdown();

  void connect(World& world);
  void disconnect(World& world);

  void onJumped(const BodyJumped& e);
  void onLanded(const BodyLanded& e);


 private:
  struct Clip {
    SDL_AudioStream* stream = nullptr;
    Uint8* data = nullptr;
    Uint32 length = 0;
  };

  bool loadClip(const std::string& path, Clip& out);
  void play(Clip& clip);
  static void release(Clip& clip);

  const World* world_ = nullptr;
  Clip jump_{};
  Clip land_{};
};
