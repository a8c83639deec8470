#pragma once
#include <vector>
#include <mutex>
#include <optional>
#include <functional>
#include "chart.hpp"
#include "clock.hpp"
#include "events.hpp"
#include "results.hpp"
#include "score.hpp"
#include "settings.hpp"
#include "sustain.hpp"
#include "timeline.hpp"

// A lane key going down (pressed) or up. time is session time, normally
// taken from Session::currentTime() when the key event arrived.
struct InputEvent {
  int lane = 0;
  double time = 0.0;
  bool pressed = true;
};

// One play of one difficulty. Every mutation of note state happens inside
// tick(), which runs: clock -> spawn -> buffered inputs -> sustains -> sweep
// -> fade expiry -> song end. All public members lock the same mutex, so input
// may be submitted from another thread than the one calling tick().
// The sink is called from tick() after the lock is released.
class Session {
public:
  // Throws std::invalid_argument without an audio clock, with an empty track
  // or with settings that fail validateSettings().
  Session(const DifficultyTrack& track, ChartInfo info, GameplaySettings settings,
          AudioClock* audio, PresentationSink& sink);

  std::vector<GameEvent> tick();

  // Buffered until the next tick. Dropped (false) while paused, after the
  // session ended, or for a lane that does not exist.
  bool submitInput(const InputEvent& in);

  double currentTime() const;
  void pause();
  void resume();
  bool paused() const;
  // Starts over from the untouched chart. False once finalized.
  bool restart();
  // Releases every note; the session does nothing afterwards.
  void teardown();

  bool setNoteSpeed(double speed);
  double noteSpeed() const;
  void setLatencyOffsetMs(int ms);
  int latencyOffsetMs() const;

  bool finalized() const;
  std::optional<ResultsSummary> results() const;
  ScoreState score() const;
  NoteRecord note(size_t idx) const;
  size_t noteCount() const;
  size_t activeCount() const;
  const ChartInfo& info() const { return info_; }

  // Host time used to interpolate the audio clock. Defaults to steady_clock.
  void setHostTimeSource(std::function<double()> source);

private:
  struct TickOutput {
    std::vector<GameEvent> events;
    std::optional<ResultsSummary> finalized;
  };

  TickOutput tickLocked();
  void spawnDue(double now, std::vector<GameEvent>& out);
  void handleInput(const InputEvent& in, double now, std::vector<GameEvent>& out);
  void finishHold(const HoldResult& r, double now, std::vector<GameEvent>& out);
  void reportMiss(size_t idx, double now, std::vector<GameEvent>& out);
  void publishScore(const ScoreState& before, double now, std::vector<GameEvent>& out) const;
  void expireFaded(double now, std::vector<GameEvent>& out);
  bool songOver(double now) const;
  bool audioEnded() const;
  void flushRemaining(double now, std::vector<GameEvent>& out);
  ResultsSummary buildResults() const;
  double hostNow() const;

  mutable std::mutex mu_;
  DifficultyTrack pristine_;
  DifficultyTrack track_;
  ChartInfo info_;
  GameplaySettings settings_;
  AudioClock* audio_;
  PresentationSink& sink_;
  SessionClock clock_;
  Timeline timeline_;
  ActiveNoteSet active_;
  SustainTracker holds_;
  ScoreState score_;
  std::vector<InputEvent> inputs_;
  std::vector<size_t> fading_;  // resolved notes not yet past expiresAt
  std::optional<ResultsSummary> results_;
  bool tornDown_ = false;
  std::function<double()> hostTime_;
};
