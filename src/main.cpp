#include <string>
#include <vector>
#include <optional>
#include <iostream>
#include <iomanip>
#include <filesystem>
#include <exception>

#ifdef NH_ENABLE_AUDIO
#include <portaudio.h>
#endif
#include <SDL.h>

#include "autoplay.hpp"
#include "chart.hpp"
#include "clock.hpp"
#include "events.hpp"
#include "results.hpp"
#include "session.hpp"
#include "settings.hpp"

namespace fs = std::filesystem;

// --------- Config ---------
static constexpr double kSampleRate = 48000.0;
static constexpr unsigned kFramesPerBuffer = 256;
static constexpr int kSpeedStep = 1;
static constexpr int kLatencyStepMs = 5;

// --------- Clocks ---------
// Host clock on SDL's performance counter, for runs without an audio device.
class SteadyClock : public AudioClock {
public:
  SteadyClock() { restart(); }
  double playbackTime() const override {
    Uint64 now = paused_ ? pausedAt_ : SDL_GetPerformanceCounter();
    return double(now - start_ - pausedTotal_) / freq_;
  }
  bool isPlaying() const override { return !paused_; }
  void setPaused(bool paused) override {
    if (paused == paused_) return;
    if (paused) pausedAt_ = SDL_GetPerformanceCounter();
    else pausedTotal_ += SDL_GetPerformanceCounter() - pausedAt_;
    paused_ = paused;
  }
  void restart() override {
    freq_ = (double)SDL_GetPerformanceFrequency();
    start_ = SDL_GetPerformanceCounter();
    pausedTotal_ = 0;
    paused_ = false;
  }

private:
  double freq_ = 1.0;
  Uint64 start_ = 0;
  Uint64 pausedAt_ = 0;
  Uint64 pausedTotal_ = 0;
  bool paused_ = false;
};

#ifdef NH_ENABLE_AUDIO
// --------- PortAudio ---------
// Output stream whose device time is the song clock. Decoding is the host
// application's business, so the stream plays silence.
static int silenceCb(const void*, void* output, unsigned long frameCount,
                     const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags, void*) {
  float* out = static_cast<float*>(output);
  for (unsigned long i = 0; i < frameCount * 2; ++i) out[i] = 0.f;
  return paContinue;
}

class PortAudioClock : public AudioClock {
public:
  bool open() {
    PaError err = Pa_OpenDefaultStream(&stream_, 0, 2, paFloat32, kSampleRate,
                                       kFramesPerBuffer, silenceCb, nullptr);
    if (err != paNoError) {
      std::cerr << "Pa_OpenDefaultStream: " << Pa_GetErrorText(err) << "\n";
      stream_ = nullptr;
      return false;
    }
    err = Pa_StartStream(stream_);
    if (err != paNoError) { std::cerr << "Pa_StartStream: " << Pa_GetErrorText(err) << "\n"; return false; }
    restart();
    return true;
  }
  void close() {
    if (!stream_) return;
    Pa_StopStream(stream_);
    Pa_CloseStream(stream_);
    stream_ = nullptr;
  }
  double playbackTime() const override {
    if (!stream_) return 0.0;
    double now = paused_ ? pausedAt_ : Pa_GetStreamTime(stream_);
    return now - start_ - pausedTotal_;
  }
  bool isPlaying() const override { return stream_ && !paused_; }
  void setPaused(bool paused) override {
    if (!stream_ || paused == paused_) return;
    if (paused) pausedAt_ = Pa_GetStreamTime(stream_);
    else pausedTotal_ += Pa_GetStreamTime(stream_) - pausedAt_;
    paused_ = paused;
  }
  void restart() override {
    if (!stream_) return;
    start_ = Pa_GetStreamTime(stream_);
    pausedTotal_ = 0.0;
    paused_ = false;
  }

private:
  PaStream* stream_ = nullptr;
  double start_ = 0.0;
  double pausedAt_ = 0.0;
  double pausedTotal_ = 0.0;
  bool paused_ = false;
};
#endif

// --------- Input ---------
std::vector<SDL_Keycode> resolveLaneKeys(const std::vector<std::string>& names) {
  std::vector<SDL_Keycode> keys;
  for (const auto& n : names) keys.push_back(SDL_GetKeyFromName(n.c_str()));
  return keys;
}

std::optional<int> laneForKey(const std::vector<SDL_Keycode>& keys, SDL_Keycode k) {
  if (k == SDLK_UNKNOWN) return std::nullopt;
  for (size_t i = 0; i < keys.size(); ++i)
    if (keys[i] == k) return (int)i;
  return std::nullopt;
}

// --------- Console presentation ---------
class ConsoleSink : public PresentationSink {
public:
  explicit ConsoleSink(std::ostream& os) : os_(os) {}
  void onEvent(const GameEvent& e) override {
    switch (e.kind) {
      case EventKind::NoteHit:
        os_ << std::fixed << std::setprecision(3) << "[" << e.time << "] lane " << e.lane << " "
            << accuracyName(e.accuracy) << " (" << std::showpos << int(e.offset * 1000.0)
            << std::noshowpos << " ms)\n";
        break;
      case EventKind::NoteMissed:
        os_ << std::fixed << std::setprecision(3) << "[" << e.time << "] lane " << e.lane << " miss\n";
        break;
      case EventKind::Whiff:
        os_ << std::fixed << std::setprecision(3) << "[" << e.time << "] lane " << e.lane << " whiff\n";
        break;
      case EventKind::SustainCompleted:
      case EventKind::SustainBroken:
        os_ << "  " << eventName(e.kind) << " +" << e.value << "\n";
        break;
      case EventKind::MultiplierChanged:
        if (e.value > 1) os_ << "  x" << e.value << "\n";
        break;
      default:
        break;
    }
  }
  void onSessionFinalized(const ResultsSummary& r) override {
    os_ << "\n" << r.song << " - " << r.artist << " [" << r.difficulty << "]\n"
        << "Score:      " << r.finalScore << "\n"
        << std::fixed << std::setprecision(1)
        << "Accuracy:   " << r.accuracyPercent << "%\n"
        << "Max combo:  " << r.maxCombo << "\n"
        << "Perfect " << r.perfectCount << "  Great " << r.greatCount
        << "  Good " << r.goodCount << "  Ok " << r.okCount << "  Miss " << r.missedCount << "\n"
        << "Completion: " << r.completionPercent << "% of " << r.totalNotes << " notes\n";
  }

private:
  std::ostream& os_;
};

// --------- Command line ---------
struct Options {
  fs::path chartPath = fs::path("charts") / "example.chart";
  std::string difficulty = "Expert";
  std::optional<fs::path> settingsPath;
  std::optional<fs::path> resultsPath;
  bool autoplay = false;
};

std::optional<Options> parseArgs(int argc, char** argv) {
  Options o;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--autoplay") o.autoplay = true;
    else if (a == "--settings" && i + 1 < argc) o.settingsPath = fs::path(argv[++i]);
    else if (a == "--results" && i + 1 < argc) o.resultsPath = fs::path(argv[++i]);
    else if (!a.empty() && a[0] == '-') { std::cerr << "Unknown option: " << a << "\n"; return std::nullopt; }
    else positional.push_back(a);
  }
  if (positional.size() > 2) { std::cerr << "Too many arguments\n"; return std::nullopt; }
  if (positional.size() > 0) o.chartPath = positional[0];
  if (positional.size() > 1) o.difficulty = positional[1];
  return o;
}

// --------- App ---------
struct App {
  SDL_Window* window = nullptr;
  SDL_Renderer* r = nullptr;
  bool running = true;
  std::vector<SDL_Keycode> laneKeys;
  AutoplayInput* autoplay = nullptr; // plays along when set
};

bool initSDL(App& app) {
  if (SDL_Init(SDL_INIT_VIDEO|SDL_INIT_EVENTS|SDL_INIT_TIMER) != 0) {
    std::cerr << "SDL_Init: " << SDL_GetError() << "\n"; return false;
  }
  app.window = SDL_CreateWindow("notehighway", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                640, 360, SDL_WINDOW_SHOWN);
  if (!app.window) { std::cerr << "SDL_CreateWindow: " << SDL_GetError() << "\n"; return false; }
  app.r = SDL_CreateRenderer(app.window, -1, SDL_RENDERER_PRESENTVSYNC);
  if (!app.r) { std::cerr << "SDL_CreateRenderer: " << SDL_GetError() << "\n"; return false; }
  return true;
}

void handleEvent(App& app, Session& session, const SDL_Event& e) {
  if (e.type == SDL_QUIT) { app.running = false; return; }
  if (e.type != SDL_KEYDOWN && e.type != SDL_KEYUP) return;
  if (e.key.repeat) return;
  const SDL_Keycode k = e.key.keysym.sym;
  const bool down = e.type == SDL_KEYDOWN;

  if (auto lane = laneForKey(app.laneKeys, k)) {
    session.submitInput({*lane, session.currentTime(), down});
    return;
  }
  if (!down) return;
  if (k == SDLK_ESCAPE) {
    if (session.paused()) session.resume(); else session.pause();
  } else if (k == SDLK_r && session.paused()) {
    if (session.restart() && app.autoplay) app.autoplay->rewind();
  } else if (k == SDLK_q) {
    app.running = false;
  } else if (k == SDLK_UP) {
    session.setNoteSpeed(session.noteSpeed() + kSpeedStep);
  } else if (k == SDLK_DOWN) {
    session.setNoteSpeed(session.noteSpeed() - kSpeedStep);
  } else if (k == SDLK_EQUALS || k == SDLK_PLUS) {
    session.setLatencyOffsetMs(session.latencyOffsetMs() + kLatencyStepMs);
  } else if (k == SDLK_MINUS) {
    session.setLatencyOffsetMs(session.latencyOffsetMs() - kLatencyStepMs);
  }
}

// Hands the autoplay presses that are due to the session.
void feedAutoplay(App& app, Session& session) {
  if (!app.autoplay) return;
  for (const auto& in : app.autoplay->due(session.currentTime())) session.submitInput(in);
}

// --------- Main ---------
#ifndef NOTEHIGHWAY_NO_MAIN
int main(int argc, char** argv) {
  auto opts = parseArgs(argc, argv);
  if (!opts) {
    std::cerr << "usage: notehighway [chart] [difficulty] [--settings file] [--results file] [--autoplay]\n";
    return 2;
  }

  GameplaySettings settings;
  if (opts->settingsPath && !loadSettings(*opts->settingsPath, settings)) return 1;

  LoadedChart chart;
  try {
    chart = loadChart(opts->chartPath, opts->difficulty, settings.lanes);
  } catch (const ParseError& e) {
    std::cerr << "Chart error: " << e.what() << "\n";
    return 1;
  }
  std::cout << "Loaded " << chart.info.songName << " - " << chart.info.artist << " ["
            << chart.track.difficulty() << "], " << chart.track.size() << " notes\n";

  App app{};
  if (!initSDL(app)) { std::cerr << "SDL init failed\n"; return 1; }
  app.laneKeys = resolveLaneKeys(settings.laneKeys);

  AudioClock* audio = nullptr;
  SteadyClock steady;
#ifdef NH_ENABLE_AUDIO
  PortAudioClock pa;
  PaError err = Pa_Initialize();
  const bool paReady = err == paNoError;
  if (!paReady) {
    std::cerr << "Pa_Initialize: " << Pa_GetErrorText(err) << "\n";
  } else if (pa.open()) {
    audio = &pa;
  } else {
    std::cerr << "No audio output, using the system clock\n";
  }
#endif
  if (!audio) {
    steady.restart();
    audio = &steady;
  }

  ConsoleSink sink(std::cout);
  int status = 0;
  try {
    Session session(chart.track, chart.info, settings, audio, sink);
    std::optional<AutoplayInput> autoplay;
    if (opts->autoplay) {
      autoplay.emplace(chart.track);
      app.autoplay = &*autoplay;
    }

    while (app.running && !session.finalized()) {
      SDL_Event e;
      while (SDL_PollEvent(&e)) handleEvent(app, session, e);
      feedAutoplay(app, session);
      session.tick();

      SDL_SetRenderDrawColor(app.r, 12, 12, 16, 255);
      SDL_RenderClear(app.r);
      SDL_RenderPresent(app.r);
      SDL_Delay(1);
    }

    if (auto results = session.results()) {
      if (opts->resultsPath && !writeResults(*opts->resultsPath, *results)) status = 1;
    }
    session.teardown();
  } catch (const std::exception& e) {
    std::cerr << "Session error: " << e.what() << "\n";
    status = 1;
  }

  // Cleanup
#ifdef NH_ENABLE_AUDIO
  pa.close();
  if (paReady) Pa_Terminate();
#endif
  if (app.r) SDL_DestroyRenderer(app.r);
  if (app.window) SDL_DestroyWindow(app.window);
  SDL_Quit();

  return status;
}
#endif // NOTEHIGHWAY_NO_MAIN
