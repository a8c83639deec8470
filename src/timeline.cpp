#include "timeline.hpp"

double travelDuration(double spawnDistance, double noteSpeed) {
  return spawnDistance / noteSpeed;
}

std::vector<size_t> advance(DifficultyTrack& track, Timeline& timeline, ActiveNoteSet& active,
                            double now, double travel) {
  std::vector<size_t> spawned;
  const auto& notes = track.notes();

  // skip the prefix that has already left Pending
  while (timeline.cursor < notes.size() && notes[timeline.cursor].status != NoteStatus::Pending)
    ++timeline.cursor;

  for (size_t i = timeline.cursor; i < notes.size(); ++i) {
    if (now < notes[i].t - travel) break;
    if (notes[i].status != NoteStatus::Pending) continue;
    track.markSpawned(i, now);
    active.insert(i);
    spawned.push_back(i);
  }
  return spawned;
}
