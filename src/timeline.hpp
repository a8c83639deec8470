#pragma once
#include <vector>
#include <cstddef>
#include "chart.hpp"
#include "active_notes.hpp"

// Remembers how much of the track is already spawned so each tick only
// looks at the notes that can still become due.
struct Timeline {
  size_t cursor = 0;
};

// Seconds a note needs to travel from its spawn point to the hit line.
double travelDuration(double spawnDistance, double noteSpeed);

// Spawns every Pending note with now >= t - travel, adds it to active and
// returns the indices in track order. Notes that are not Pending are never
// returned, however the clock jitters.
std::vector<size_t> advance(DifficultyTrack& track, Timeline& timeline, ActiveNoteSet& active,
                            double now, double travel);
