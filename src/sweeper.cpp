#include "sweeper.hpp"

std::vector<size_t> sweep(DifficultyTrack& track, ActiveNoteSet& active, double now,
                          double missGrace, double fade) {
  std::vector<size_t> missed;
  for (size_t idx : active) {
    if (!(now > track.note(idx).t + missGrace)) break;
    missed.push_back(idx);
  }
  for (size_t idx : missed) {
    track.markMissed(idx, now, fade);
    active.erase(idx);
  }
  return missed;
}
