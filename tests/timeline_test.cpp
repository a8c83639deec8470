#include "../src/timeline.hpp"
#include <cassert>
#include <cmath>
#include <stdexcept>

int main() {
    DifficultyTrack track("Expert", {{0, 1.0, 0.0}, {1, 2.0, 0.0}, {2, 5.0, 0.0}});
    Timeline tl;
    ActiveNoteSet active;
    const double travel = travelDuration(25.0, 15.0);
    assert(std::fabs(travel - 25.0 / 15.0) < 1e-12);

    // t - travel of the first note is already behind us
    auto s = advance(track, tl, active, 0.0, travel);
    assert(s.size() == 1 && s[0] == 0);
    assert(track.note(0).status == NoteStatus::Spawned);
    assert(track.note(0).spawnedAt == 0.0);
    assert(active.contains(0));

    // nothing new until the next note is due
    assert(advance(track, tl, active, 0.3, travel).empty());
    s = advance(track, tl, active, 0.4, travel);
    assert(s.size() == 1 && s[0] == 1);

    // the same instant again spawns nothing twice
    assert(advance(track, tl, active, 0.4, travel).empty());

    // a clock that jumps back does not respawn either
    assert(advance(track, tl, active, 0.1, travel).empty());

    // a resolved note is never spawned again
    track.markMissed(0, 1.5, 0.5);
    active.erase(0);
    s = advance(track, tl, active, 10.0, travel);
    assert(s.size() == 1 && s[0] == 2);
    assert(active.size() == 2);
    assert(advance(track, tl, active, 11.0, travel).empty());

    // Zero travel spawns exactly at the target time
    DifficultyTrack t2("Easy", {{0, 1.0, 0.0}, {0, 1.0, 0.0}});
    Timeline tl2;
    ActiveNoteSet a2;
    assert(advance(t2, tl2, a2, 0.999, 0.0).empty());
    assert(advance(t2, tl2, a2, 1.0, 0.0).size() == 2);

    // Illegal transitions are rejected by the track
    bool threw = false;
    try { t2.markSpawned(0, 2.0); } catch (const std::logic_error&) { threw = true; }
    assert(threw);
    threw = false;
    try { a2.insert(0); } catch (const std::logic_error&) { threw = true; }
    assert(threw);
    return 0;
}
