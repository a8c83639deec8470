#include "events.hpp"

const char* eventName(EventKind k) {
  switch (k) {
    case EventKind::NoteSpawned:       return "spawn";
    case EventKind::NoteHit:           return "hit";
    case EventKind::NoteMissed:        return "miss";
    case EventKind::Whiff:             return "whiff";
    case EventKind::SustainCompleted:  return "sustain-done";
    case EventKind::SustainBroken:     return "sustain-broken";
    case EventKind::NoteExpired:       return "expired";
    case EventKind::ScoreChanged:      return "score";
    case EventKind::ComboChanged:      return "combo";
    case EventKind::MultiplierChanged: return "multiplier";
  }
  return "?";
}
