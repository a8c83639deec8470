#pragma once
#include <cstddef>
#include "chart.hpp"
#include "active_notes.hpp"

// All windows are half-widths in seconds around a note's target time.
struct HitWindows {
  double hit = 0.1;        // outer edge: a press further away is a whiff
  double perfect = 0.05;
  double great = 0.08;
  double good = 0.1;       // between good and hit the press is Ok
  double missGrace = 0.15; // untouched notes are missed after t + missGrace
};

struct JudgeOutcome {
  bool hit = false;
  size_t note = 0;
  Accuracy accuracy = Accuracy::Perfect;
  double offset = 0.0; // press time - target time, negative when early
};

Accuracy classify(double distance, const HitWindows& w);

// Resolves the closest active note in lane within w.hit of now (ties go to
// the earlier note): marks it Hit and removes it from active. hit == false
// means nothing was in reach; the caller scores that press as a miss.
JudgeOutcome judge(DifficultyTrack& track, ActiveNoteSet& active, int lane, double now,
                   const HitWindows& w, double fade);
