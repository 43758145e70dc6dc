#include "core/App.h"

#include <SDL3/SDL_hints.h>

#include <cstdio>
#include <cstdlib>
#include <string_view>

#ifdef __EMSCRIPTEN__
#include <emscripten.h>
#endif

namespace {

void usage(const char* argv0) {
  std::printf(
      "usage: %s [--frames N] [--levels PATH] [--level ID] [--movement PATH] "
      "[--input-script PATH] [--video-driver NAME] [--no-ui] [--width W] [--height H]\n",
      argv0);
  std::printf("  --frames N            Run N frames then exit (smoke test)\n");
  std::printf("  --levels PATH         Level catalog TOML (default: assets/levels.toml)\n");
  std::printf("  --level ID            Start in this catalog level instead of the default\n");
  std::printf("  --movement PATH       Movement tuning TOML (default: assets/movement.toml)\n");
  std::printf("  --input-script PATH   Drive the player from TOML keyframes\n");
  std::printf("  --video-driver NAME   Force SDL video backend (e.g. x11, wayland, offscreen)\n");
  std::printf("  --no-ui               Disable the debug UI\n");
  std::printf("  --width W             Window width (default: 1280)\n");
  std::printf("  --height H            Window height (default: 720)\n");
  std::printf("  -h, --help            Show this help\n");
}

bool parseInt(const char* s, int& out) {
  if (!s || !*s)
    return false;
  char* end = nullptr;
  const long v = std::strtol(s, &end, 10);
  if (!end || *end != '\0')
    return false;
  if (v < 1 || v > 100000)
    return false;
  out = static_cast<int>(v);
  return true;
}

// Options that take a path or name: returns false (after printing usage) when it is missing.
bool takeValue(int argc, char** argv, int& i, const char*& out) {
  if (i + 1 >= argc) {
    std::printf("missing %s value\n", argv[i]);
    usage(argv[0]);
    return false;
  }
  out = argv[++i];
  return true;
}

#ifdef __EMSCRIPTEN__
void webFrame(void* userData) {
  auto* app = static_cast<App*>(userData);
  if (!app->frame()) {
    app->shutdown();
    emscripten_cancel_main_loop();
  }
}
#endif

}  // namespace

int main(int argc, char** argv) {
  AppConfig cfg{};
  cfg.argv0 = argv[0];
  const char* videoDriver = nullptr;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg == "--frames" || arg == "--width" || arg == "--height") {
      int* dst = arg == "--frames" ? &cfg.maxFrames : (arg == "--width" ? &cfg.width : &cfg.height);
      if (i + 1 >= argc || !parseInt(argv[i + 1], *dst)) {
        std::printf("invalid %s value\n", argv[i]);
        usage(argv[0]);
        return 1;
      }
      ++i;
    } else if (arg == "--levels") {
      if (!takeValue(argc, argv, i, cfg.levelsTomlPath))
        return 1;
    } else if (arg == "--level") {
      if (!takeValue(argc, argv, i, cfg.startLevel))
        return 1;
    } else if (arg == "--movement") {
      if (!takeValue(argc, argv, i, cfg.movementTomlPath))
        return 1;
    } else if (arg == "--input-script") {
      if (!takeValue(argc, argv, i, cfg.inputScriptTomlPath))
        return 1;
    } else if (arg == "--video-driver") {
      if (!takeValue(argc, argv, i, videoDriver))
        return 1;
    } else if (arg == "--no-ui") {
      cfg.noUi = true;
    } else if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    } else {
      std::printf("unknown option: %s\n", argv[i]);
      usage(argv[0]);
      return 1;
    }
  }

  if (videoDriver) {
    SDL_SetHint(SDL_HINT_VIDEO_DRIVER, videoDriver);
  }

#ifdef __EMSCRIPTEN__
  static App app;
  if (!app.init(cfg)) {
    return 1;
  }
  emscripten_set_main_loop_arg(webFrame, &app, 0, true);
  return 0;
#else
  App app;
  if (!app.init(cfg)) {
    app.shutdown();
    return 1;
  }

  app.run();
  app.shutdown();
  return 0;
#endif
}
