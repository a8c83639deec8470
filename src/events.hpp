#pragma once
#include <cstddef>
#include <cstdint>
#include "chart.hpp"

struct ResultsSummary;

enum class EventKind {
  NoteSpawned,
  NoteHit,
  NoteMissed,       // aged past the miss grace
  Whiff,            // press with no note in reach, scored as a miss
  SustainCompleted,
  SustainBroken,
  NoteExpired,      // fade time over, presentation can drop the note
  ScoreChanged,
  ComboChanged,
  MultiplierChanged,
};

const char* eventName(EventKind k);

// One judged or scheduling event. Fields that do not apply to a kind keep
// their defaults; note is an index into the session's track.
struct GameEvent {
  EventKind kind = EventKind::NoteSpawned;
  double time = 0.0;  // session time of the tick that produced it
  size_t note = 0;
  int lane = -1;
  Accuracy accuracy = Accuracy::Perfect;
  double offset = 0.0;   // NoteHit: press - target
  int64_t value = 0;     // ScoreChanged: score, ComboChanged: combo, MultiplierChanged: multiplier,
                         // Sustain*: bonus points
};

// Receives everything a session produces. Implemented by the host.
class PresentationSink {
public:
  virtual ~PresentationSink() = default;
  virtual void onEvent(const GameEvent& e) = 0;
  virtual void onSessionFinalized(const ResultsSummary& results) = 0;
};

// Drops everything.
class NullSink : public PresentationSink {
public:
  void onEvent(const GameEvent&) override {}
  void onSessionFinalized(const ResultsSummary&) override {}
};
