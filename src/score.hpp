#pragma once
#include <cstdint>
#include "chart.hpp"

struct ScoreRules {
  int perfect = 100;
  int great = 80;
  int good = 60;
  int ok = 40;
  int maxMultiplier = 4;
  int notesPerMultiplier = 10;  // consecutive hits per multiplier step
  int sustainPerSecond = 25;    // bonus for holding a sustain tail
};

struct ScoreState {
  int64_t score = 0;
  int combo = 0;
  int maxCombo = 0;
  int consecutiveHits = 0;
  int multiplier = 1;
  int perfect = 0;
  int great = 0;
  int good = 0;
  int ok = 0;
  int misses = 0;       // timeouts and whiffed presses
  int hitNotes = 0;
  int judgedNotes = 0;  // hitNotes + misses
};

int baseValue(const ScoreRules& rules, Accuracy acc);

// Returns the points added.
int64_t applyHit(ScoreState& s, const ScoreRules& rules, Accuracy acc);
void applyMiss(ScoreState& s);
int64_t applySustainBonus(ScoreState& s, const ScoreRules& rules, double heldSeconds);

int hitCount(const ScoreState& s, Accuracy acc);

// hitNotes / judgedNotes * 100, 0 when nothing has been judged yet.
double accuracyPercent(const ScoreState& s);
