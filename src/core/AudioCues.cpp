#include "core/AudioCues.h"

#include <SDL3/SDL_error.h>
#include <SDL3/SDL_stdinc.h>

#include <filesystem>

#include "ecs/World.h"
#include "util/Log.h"

namespace {

// Softer landings are not worth a sound.
constexpr float kMinLandingSpeed = 300.0F;

}  // namespace

bool AudioCues::loadClip(const std::string& path, Clip& out) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Log::info("audio: no clip at {}, cue disabled", path);
    return false;
  }

  SDL_AudioSpec spec{};
  Clip clip{};
  if (!SDL_LoadWAV(path.c_str(), &spec, &clip.data, &clip.length)) {
    Log::warn("audio: SDL_LoadWAV({}) failed: {}", path, SDL_GetError());
    return false;
  }
  clip.stream =
      SDL_OpenAudioDeviceStream(SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK, &spec, nullptr, nullptr);
  if (clip.stream == nullptr) {
    Log::warn("audio: cannot open playback stream for {}: {}", path, SDL_GetError());
    release(clip);
    return false;
  }
  if (!SDL_ResumeAudioStreamDevice(clip.stream)) {
    Log::warn("audio: cannot start playback device: {}", SDL_GetError());
  }
  out = clip;
  return true;
}

bool AudioCues::init(const std::string& audioDir) {
  const std::filesystem::path dir(audioDir);
  const bool jump = loadClip((dir / "jump.wav").string(), jump_);
  const bool land = loadClip((dir / "land.wav").string(), land_);
  return jump || land;
}

void AudioCues::release(Clip& clip) {
  if (clip.stream) {
    SDL_DestroyAudioStream(clip.stream);
    clip.stream = nullptr;
  }
  if (clip.data) {
    SDL_free(clip.data);
    clip.data = nullptr;
  }
  clip.length = 0;
}

void AudioCues::shutdown() {
  release(jump_);
  release(land_);
}

void AudioCues::connect(World& world) {
  world_ = &world;
  world.events.sink<BodyJumped>().connect<&AudioCues::onJumped>(*this);
  world.events.sink<BodyLanded>().connect<&AudioCues::onLanded>(*this);
}

void AudioCues::disconnect(World& world) {
  world.events.sink<BodyJumped>().disconnect(*this);
  world.events.sink<BodyLanded>().disconnect(*this);
  world_ = nullptr;
}

void AudioCues::play(Clip& clip) {
  if (clip.stream == nullptr) {
    return;
  }
  // Restart rather than queue behind a cue that is still playing.
  if (!SDL_ClearAudioStream(clip.stream) ||
      !SDL_PutAudioStreamData(clip.stream, clip.data, static_cast<int>(clip.length))) {
    Log::warn("audio: playback failed: {}", SDL_GetError());
  }
}

void AudioCues::onJumped(const BodyJumped& e) {
  if (world_ && e.entity == world_->player)
    play(jump_);
}

void AudioCues::onLanded(const BodyLanded& e) {
  if (world_ && e.entity == world_->player && e.impactSpeed >= kMinLandingSpeed)
    play(land_);
}
