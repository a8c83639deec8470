#pragma once
#include <vector>
#include <cstddef>
#include "chart.hpp"
#include "active_notes.hpp"

// Misses every active note with now > t + missGrace and returns them in track
// order. Run after the tick's judge calls so a valid press always wins.
std::vector<size_t> sweep(DifficultyTrack& track, ActiveNoteSet& active, double now,
                          double missGrace, double fade);
