#include "../src/settings.hpp"
#include <fstream>
#include <cassert>
#include <cmath>
#include <cstdio>

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

static void writeFile(const char* path, const char* text) {
    std::ofstream f(path);
    f << text;
}

int main() {
    GameplaySettings defaults{};
    assert(!validateSettings(defaults));
    assert(defaults.lanes == 5);
    assert(defaults.laneKeys.size() == 5);
    assert(near(travelDuration(defaults), 25.0 / 15.0));

    const char* path = "test_settings.json";
    writeFile(path, R"({
  "lanes": 4,
  "noteSpeed": 20,
  "hitWindow": 0.12,
  "perfectWindow": 0.04,
  "greatWindow": 0.07,
  "latencyOffsetMs": -15,
  "interpolateClock": false,
  "scoring": {"perfect": 300, "great": 200, "good": 100, "ok": 50, "maxMultiplier": 8},
  "laneKeys": ["A", "S", "K", "L"]
})");

    GameplaySettings s{};
    assert(loadSettings(path, s));
    assert(s.lanes == 4);
    assert(near(s.noteSpeed, 20.0));
    assert(near(s.spawnDistance, 25.0));
    assert(near(s.windows.hit, 0.12));
    assert(near(s.windows.perfect, 0.04));
    assert(near(s.windows.great, 0.07));
    assert(near(s.windows.good, 0.12));       // follows the hit window
    assert(near(s.windows.missGrace, 0.17));  // hit window + 0.05
    assert(s.latencyOffsetMs == -15);
    assert(!s.interpolateClock);
    assert(s.scoring.perfect == 300);
    assert(s.scoring.ok == 50);
    assert(s.scoring.maxMultiplier == 8);
    assert(s.scoring.notesPerMultiplier == 10);
    assert(s.laneKeys.size() == 4 && s.laneKeys[2] == "K");

    // Layered files: keys a later file leaves out stay as they were
    GameplaySettings layered{};
    writeFile(path, R"({"goodWindow": 0.09, "missGrace": 0.2})");
    assert(loadSettings(path, layered));
    writeFile(path, R"({"noteSpeed": 18})");
    assert(loadSettings(path, layered));
    assert(near(layered.noteSpeed, 18.0));
    assert(near(layered.windows.good, 0.09));
    assert(near(layered.windows.missGrace, 0.2));

    // Invalid window ordering: rejected, s untouched
    writeFile(path, R"({"perfectWindow": 0.09, "greatWindow": 0.08})");
    GameplaySettings keep{};
    keep.noteSpeed = 7.0;
    assert(!loadSettings(path, keep));
    assert(near(keep.noteSpeed, 7.0));
    assert(near(keep.windows.perfect, 0.05));

    // One key per lane
    writeFile(path, R"({"lanes": 3})");
    assert(!loadSettings(path, keep));

    // Wrong types and broken JSON
    writeFile(path, R"({"noteSpeed": "fast"})");
    assert(!loadSettings(path, keep));
    writeFile(path, "{ nope");
    assert(!loadSettings(path, keep));
    std::remove(path);

    assert(!loadSettings("missing_settings.json", keep));

    GameplaySettings bad{};
    bad.noteSpeed = 0.0;
    assert(validateSettings(bad));
    bad = GameplaySettings{};
    bad.windows.missGrace = 0.05;
    assert(validateSettings(bad));
    bad = GameplaySettings{};
    bad.scoring.great = bad.scoring.perfect;
    assert(validateSettings(bad));
    bad = GameplaySettings{};
    bad.lanes = 0;
    assert(validateSettings(bad));
    return 0;
}
