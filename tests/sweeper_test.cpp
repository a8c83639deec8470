#include "../src/sweeper.hpp"
#include "../src/judge.hpp"
#include "../src/timeline.hpp"
#include <cassert>

int main() {
    DifficultyTrack track("Expert", {{0, 1.0, 0.0}, {1, 1.5, 0.0}, {2, 4.0, 0.0}});
    Timeline tl;
    ActiveNoteSet active;
    advance(track, tl, active, 2.0, 2.0);
    assert(active.size() == 3);

    const double grace = 0.15;
    assert(sweep(track, active, 1.1, grace, 0.5).empty());

    auto missed = sweep(track, active, 1.2, grace, 0.5);
    assert(missed.size() == 1 && missed[0] == 0);
    const NoteRecord& n = track.note(0);
    assert(n.status == NoteStatus::Missed);
    assert(!n.accuracy);
    assert(n.resolvedAt == 1.2);
    assert(n.expiresAt == 1.7);
    assert(!active.contains(0));

    // A note hit before the sweep is never also missed
    HitWindows w{};
    assert(judge(track, active, 1, 1.55, w, 0.5).hit);
    assert(sweep(track, active, 3.0, grace, 0.5).empty());
    assert(track.note(1).status == NoteStatus::Hit);

    // Several at once come back in track order
    DifficultyTrack t2("Easy", {{3, 1.0, 0.0}, {0, 1.0, 0.0}, {1, 1.05, 0.0}});
    Timeline tl2;
    ActiveNoteSet a2;
    advance(t2, tl2, a2, 1.0, 1.0);
    missed = sweep(t2, a2, 2.0, grace, 0.5);
    assert(missed.size() == 3);
    assert(missed[0] == 0 && missed[1] == 1 && missed[2] == 2);
    assert(t2.note(0).lane == 0);
    assert(a2.empty());
    assert(t2.countWithStatus(NoteStatus::Missed) == 3);
    return 0;
}
