#include "../src/judge.hpp"
#include "../src/timeline.hpp"
#include <cassert>
#include <cmath>
#include <vector>
#include <initializer_list>

struct Fixture {
    DifficultyTrack track;
    Timeline tl;
    ActiveNoteSet active;

    Fixture(std::initializer_list<NoteEvent> notes) : track("Expert", std::vector<NoteEvent>(notes)) {
        advance(track, tl, active, 100.0, 1000.0);
    }
};

static JudgeOutcome pressAt(double now, int lane = 0) {
    Fixture f{{0, 1.0, 0.0}};
    return judge(f.track, f.active, lane, now, HitWindows{}, 0.5);
}

int main() {
    HitWindows w{};
    assert(classify(0.0, w) == Accuracy::Perfect);
    assert(classify(0.05, w) == Accuracy::Perfect);
    assert(classify(0.06, w) == Accuracy::Great);
    assert(classify(0.09, w) == Accuracy::Good);

    // Tiers around a note at 1.0
    JudgeOutcome o = pressAt(1.03);
    assert(o.hit && o.accuracy == Accuracy::Perfect);
    assert(std::fabs(o.offset - 0.03) < 1e-9);
    o = pressAt(0.93);
    assert(o.hit && o.accuracy == Accuracy::Great);
    assert(o.offset < 0.0);
    o = pressAt(1.095);
    assert(o.hit && o.accuracy == Accuracy::Good);
    assert(!pressAt(1.15).hit);
    assert(!pressAt(0.85).hit);
    assert(!pressAt(1.0, 1).hit); // wrong lane

    // Ok only exists when the good window is narrower than the hit window
    HitWindows narrow{};
    narrow.good = 0.09;
    assert(classify(0.095, narrow) == Accuracy::Ok);

    // A hit resolves the note and takes it out of the active set
    Fixture f{{0, 1.0, 0.0}};
    o = judge(f.track, f.active, 0, 1.0, w, 0.5);
    assert(o.hit && o.note == 0);
    assert(f.track.note(0).status == NoteStatus::Hit);
    assert(f.track.note(0).accuracy == Accuracy::Perfect);
    assert(f.track.note(0).resolvedAt == 1.0);
    assert(f.track.note(0).expiresAt == 1.5);
    assert(f.active.empty());
    // and cannot be hit twice
    assert(!judge(f.track, f.active, 0, 1.0, w, 0.5).hit);

    // Closest note in the lane wins
    Fixture close{{0, 1.0, 0.0}, {0, 1.125, 0.0}, {1, 1.1, 0.0}};
    o = judge(close.track, close.active, 0, 1.1, w, 0.5);
    assert(o.hit && close.track.note(o.note).t == 1.125);

    // Equal distance goes to the earlier note
    HitWindows wide{};
    wide.hit = 0.2;
    wide.good = 0.2;
    wide.missGrace = 0.25;
    Fixture tie{{0, 1.0, 0.0}, {0, 1.25, 0.0}};
    o = judge(tie.track, tie.active, 0, 1.125, wide, 0.5);
    assert(o.hit && tie.track.note(o.note).t == 1.0);
    assert(tie.active.size() == 1);

    // A sustain keeps its fade until after the tail
    Fixture sus{{2, 1.0, 2.0}};
    o = judge(sus.track, sus.active, 2, 1.0, w, 0.5);
    assert(o.hit);
    assert(sus.track.note(0).expiresAt == 3.5);
    return 0;
}
