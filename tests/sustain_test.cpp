#include "../src/sustain.hpp"
#include <cassert>
#include <cmath>

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

int main() {
    const double tol = 0.1;
    SustainTracker holds;
    assert(holds.empty());

    // Let go halfway
    assert(holds.begin(0, 2, 1.0, 2.0, tol).empty());
    assert(holds.release(1, 1.5, tol).empty()); // other lane
    auto r = holds.release(2, 1.5, tol);
    assert(r.size() == 1);
    assert(r[0].note == 0 && r[0].lane == 2);
    assert(!r[0].completed);
    assert(near(r[0].heldSeconds, 0.5));
    assert(holds.empty());

    // Letting go just before the end still completes the tail
    holds.begin(1, 2, 1.0, 2.0, tol);
    r = holds.release(2, 1.95, tol);
    assert(r.size() == 1 && r[0].completed);
    assert(near(r[0].heldSeconds, 1.0));

    // Holding to the end completes on update
    holds.begin(2, 0, 3.0, 3.5, tol);
    holds.begin(3, 1, 3.0, 4.0, tol);
    assert(holds.update(3.4).empty());
    r = holds.update(3.5);
    assert(r.size() == 1 && r[0].note == 2 && r[0].completed);
    assert(near(r[0].heldSeconds, 0.5));
    assert(holds.size() == 1);

    // A new head on the same lane ends the previous hold
    r = holds.begin(4, 1, 3.5, 5.0, tol);
    assert(r.size() == 1 && r[0].note == 3 && !r[0].completed);
    assert(near(r[0].heldSeconds, 0.5));
    assert(holds.size() == 1);

    holds.clear();
    assert(holds.update(100.0).empty());
    return 0;
}
