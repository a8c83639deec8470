#include "chart.hpp"
#include <fstream>
#include <cmath>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

// Either absolute times in ms:
//   "Expert": {"notes": [{"t": 1000, "lane": 0, "len": 0}]}
// or 4/4 measures in beats at the meta bpm:
//   "Expert": {"measures": [{"notes": [{"beat": 0.0, "lane": 0, "sustain": 1.0}]}]}
static std::vector<NoteEvent> loadDifficultyJson(const json& d, double bpm, double offset) {
  std::vector<NoteEvent> out;
  const double beatSec = 60.0 / bpm;
  if (d.contains("notes") && d["notes"].is_array()) {
    for (auto& n : d["notes"]) {
      NoteEvent e{};
      e.lane     = n.at("lane").get<int>();
      e.t        = n.at("t").get<double>() / 1000.0 + offset;
      e.duration = n.value("len", 0.0) / 1000.0;
      out.push_back(e);
    }
  }
  if (d.contains("measures") && d["measures"].is_array()) {
    int measureIdx = 0;
    for (auto& mj : d["measures"]) {
      double measureStartBeats = measureIdx * 4.0; // assume 4/4
      if (mj.contains("notes") && mj["notes"].is_array()) {
        for (auto& n : mj["notes"]) {
          NoteEvent e{};
          e.lane = n.at("lane").get<int>();
          double beat = n.value("beat", 0.0) + measureStartBeats;
          e.t = beat * beatSec + offset;
          e.duration = n.value("sustain", 0.0) * beatSec;
          out.push_back(e);
        }
      }
      ++measureIdx;
    }
  }
  return out;
}

Song loadSongJson(const fs::path& path) {
  std::ifstream f(path);
  if (!f) throw ParseError("cannot open chart: " + path.string());
  Song song;
  try {
    json j; f >> j;
    double bpm = 120.0;
    if (j.contains("meta")) {
      auto m = j["meta"];
      if (m.contains("bpm"))    bpm = m["bpm"].get<double>();
      if (m.contains("title"))  song.info.songName = m["title"].get<std::string>();
      if (m.contains("artist")) song.info.artist = m["artist"].get<std::string>();
      if (m.contains("charter")) song.info.charter = m["charter"].get<std::string>();
      if (m.contains("offset")) song.info.offset = m["offset"].get<double>();
    }
    if (!(bpm > 0.0) || !std::isfinite(bpm)) throw ParseError("bpm must be positive");
    if (!j.contains("charts") || !j["charts"].is_object())
      throw ParseError("missing \"charts\" object");
    for (auto& el : j["charts"].items()) {
      const std::string name = el.key();
      const json& d = el.value();
      if (!d.is_object()) throw ParseError("chart \"" + name + "\" is not an object");
      song.difficulties[name] = loadDifficultyJson(d, bpm, song.info.offset);
    }
  } catch (const json::exception& e) {
    throw ParseError(path.string() + ": " + e.what());
  }
  return song;
}
