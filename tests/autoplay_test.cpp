#include "../src/autoplay.hpp"
#include <cassert>

int main() {
    DifficultyTrack track("Expert", {{0, 1.0, 0.0}, {1, 1.0, 0.5}, {0, 2.0, 0.0}});
    AutoplayInput bot(track);
    assert(!bot.done());
    assert(bot.due(0.99).empty());

    auto in = bot.due(1.0);
    assert(in.size() == 2);
    assert(in[0].pressed && in[1].pressed);
    assert(in[0].time == 1.0 && in[1].time == 1.0);

    // tap release, then the sustain release at its tail
    in = bot.due(1.1);
    assert(in.size() == 1 && !in[0].pressed && in[0].lane == 0);
    in = bot.due(1.5);
    assert(in.size() == 1 && !in[0].pressed && in[0].lane == 1);

    // handed out once only
    assert(bot.due(1.5).empty());

    in = bot.due(10.0);
    assert(in.size() == 2);
    assert(in[0].pressed && in[0].time == 2.0);
    assert(!in[1].pressed);
    assert(bot.done());

    bot.rewind();
    assert(bot.due(10.0).size() == 6);

    // An offset plays every note late by the same amount
    AutoplayInput late(track, 0.02);
    in = late.due(1.01);
    assert(in.empty());
    in = late.due(1.03);
    assert(in.size() == 2);
    return 0;
}
