#include "../src/chart.hpp"
#include <fstream>
#include <cassert>
#include <cmath>

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

int main() {
    namespace fs = std::filesystem;
    fs::path tmp = fs::temp_directory_path() / "notehighway_simple.json";
    std::ofstream f(tmp);
    f << R"({
  "meta": {"bpm": 120, "title": "Test", "artist": "Band", "offset": 0.25},
  "charts": {
    "Expert": {"measures": [
      {"notes": [
        {"beat": 0.0, "lane": 1, "sustain": 1.0}
      ]},
      {"notes": [
        {"beat": 1.0, "lane": 3}
      ]}
    ]},
    "Hard": {"notes": [
      {"t": 1000, "lane": 0, "len": 250},
      {"t": 500, "lane": 2}
    ]}
  }
})";
    f.close();

    LoadedChart c = loadChart(tmp, "Expert", 5);
    assert(c.info.songName == "Test");
    assert(c.info.artist == "Band");
    assert(c.track.size() == 2);
    const NoteRecord& n = c.track.note(0);
    assert(near(n.t, 0.25));
    assert(n.lane == 1);
    assert(near(n.duration, 0.5)); // 1 beat at 120 BPM
    assert(near(c.track.note(1).t, 2.75)); // beat 1 of the second measure

    // Absolute times come back sorted
    LoadedChart hard = loadChart(tmp, "hard", 5);
    assert(hard.track.size() == 2);
    assert(near(hard.track.note(0).t, 0.75));
    assert(hard.track.note(0).lane == 2);
    assert(near(hard.track.note(1).t, 1.25));
    assert(near(hard.track.note(1).duration, 0.25));
    fs::remove(tmp);

    // Missing "charts"
    fs::path bad = fs::temp_directory_path() / "notehighway_bad.json";
    std::ofstream b(bad);
    b << R"({"meta": {"bpm": 120}})";
    b.close();
    bool threw = false;
    try { loadSong(bad); } catch (const ParseError&) { threw = true; }
    assert(threw);

    // Not JSON at all
    std::ofstream b2(bad);
    b2 << "{ this is not json";
    b2.close();
    threw = false;
    try { loadSong(bad); } catch (const ParseError&) { threw = true; }
    assert(threw);
    fs::remove(bad);

    // Unsupported extension
    fs::path other = fs::temp_directory_path() / "notehighway_song.txt";
    std::ofstream o(other);
    o << "x";
    o.close();
    threw = false;
    try { loadSong(other); } catch (const ParseError&) { threw = true; }
    assert(threw);
    fs::remove(other);
    return 0;
}
