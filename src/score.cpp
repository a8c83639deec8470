#include "score.hpp"
#include <algorithm>
#include <cmath>

int baseValue(const ScoreRules& rules, Accuracy acc) {
  switch (acc) {
    case Accuracy::Perfect: return rules.perfect;
    case Accuracy::Great:   return rules.great;
    case Accuracy::Good:    return rules.good;
    case Accuracy::Ok:      return rules.ok;
  }
  return 0;
}

int64_t applyHit(ScoreState& s, const ScoreRules& rules, Accuracy acc) {
  ++s.judgedNotes;
  ++s.hitNotes;
  ++s.consecutiveHits;
  ++s.combo;
  s.maxCombo = std::max(s.maxCombo, s.combo);
  switch (acc) {
    case Accuracy::Perfect: ++s.perfect; break;
    case Accuracy::Great:   ++s.great; break;
    case Accuracy::Good:    ++s.good; break;
    case Accuracy::Ok:      ++s.ok; break;
  }
  // the hit is paid at the multiplier it was played under
  int64_t gained = (int64_t)baseValue(rules, acc) * s.multiplier;
  s.score += gained;
  s.multiplier = std::min(1 + s.consecutiveHits / rules.notesPerMultiplier, rules.maxMultiplier);
  return gained;
}

void applyMiss(ScoreState& s) {
  ++s.judgedNotes;
  ++s.misses;
  s.combo = 0;
  s.consecutiveHits = 0;
  s.multiplier = 1;
}

int64_t applySustainBonus(ScoreState& s, const ScoreRules& rules, double heldSeconds) {
  if (heldSeconds <= 0.0) return 0;
  int64_t gained = (int64_t)std::floor(heldSeconds * rules.sustainPerSecond) * s.multiplier;
  s.score += gained;
  return gained;
}

int hitCount(const ScoreState& s, Accuracy acc) {
  switch (acc) {
    case Accuracy::Perfect: return s.perfect;
    case Accuracy::Great:   return s.great;
    case Accuracy::Good:    return s.good;
    case Accuracy::Ok:      return s.ok;
  }
  return 0;
}

double accuracyPercent(const ScoreState& s) {
  if (s.judgedNotes <= 0) return 0.0;
  return (double)s.hitNotes / (double)s.judgedNotes * 100.0;
}
