#include "judge.hpp"
#include <cmath>

Accuracy classify(double distance, const HitWindows& w) {
  if (distance <= w.perfect) return Accuracy::Perfect;
  if (distance <= w.great) return Accuracy::Great;
  if (distance <= w.good) return Accuracy::Good;
  return Accuracy::Ok;
}

JudgeOutcome judge(DifficultyTrack& track, ActiveNoteSet& active, int lane, double now,
                   const HitWindows& w, double fade) {
  JudgeOutcome out;
  double best = w.hit;
  bool found = false;
  size_t bestIdx = 0;
  for (size_t idx : active) {
    const NoteRecord& n = track.note(idx);
    if (n.t - now > w.hit) break; // the rest are later still
    if (n.lane != lane) continue;
    double d = std::abs(now - n.t);
    // strict < keeps the earlier note on equal distance
    if (d <= w.hit && (!found || d < best)) {
      best = d;
      bestIdx = idx;
      found = true;
    }
  }
  if (!found) return out;

  out.hit = true;
  out.note = bestIdx;
  out.accuracy = classify(best, w);
  out.offset = now - track.note(bestIdx).t;
  track.markHit(bestIdx, out.accuracy, now, fade);
  active.erase(bestIdx);
  return out;
}
