#include "settings.hpp"
#include "timeline.hpp"
#include <fstream>
#include <iostream>

using json = nlohmann::json;
namespace fs = std::filesystem;

void settingsFromJson(const json& j, GameplaySettings& s) {
  s.lanes         = j.value("lanes", s.lanes);
  s.noteSpeed     = j.value("noteSpeed", s.noteSpeed);
  s.spawnDistance = j.value("spawnDistance", s.spawnDistance);

  HitWindows& w = s.windows;
  w.hit     = j.value("hitWindow", w.hit);
  w.perfect = j.value("perfectWindow", w.perfect);
  w.great   = j.value("greatWindow", w.great);
  // a new hit window drags good and missGrace along unless they are set too
  if (j.contains("goodWindow")) w.good = j["goodWindow"].get<double>();
  else if (j.contains("hitWindow")) w.good = w.hit;
  if (j.contains("missGrace")) w.missGrace = j["missGrace"].get<double>();
  else if (j.contains("hitWindow")) w.missGrace = w.hit + 0.05;

  s.fadeDuration            = j.value("fadeDuration", s.fadeDuration);
  s.latencyOffsetMs         = j.value("latencyOffsetMs", s.latencyOffsetMs);
  s.interpolateClock        = j.value("interpolateClock", s.interpolateClock);
  s.maxClockDrift           = j.value("maxClockDrift", s.maxClockDrift);
  s.sustainReleaseTolerance = j.value("sustainReleaseTolerance", s.sustainReleaseTolerance);

  if (j.contains("scoring")) {
    const json& sc = j["scoring"];
    ScoreRules& r = s.scoring;
    r.perfect            = sc.value("perfect", r.perfect);
    r.great              = sc.value("great", r.great);
    r.good               = sc.value("good", r.good);
    r.ok                 = sc.value("ok", r.ok);
    r.maxMultiplier      = sc.value("maxMultiplier", r.maxMultiplier);
    r.notesPerMultiplier = sc.value("notesPerMultiplier", r.notesPerMultiplier);
    r.sustainPerSecond   = sc.value("sustainPerSecond", r.sustainPerSecond);
  }
  if (j.contains("laneKeys") && j["laneKeys"].is_array()) {
    s.laneKeys.clear();
    for (auto& k : j["laneKeys"]) s.laneKeys.push_back(k.get<std::string>());
  }
}

bool loadSettings(const fs::path& path, GameplaySettings& s) {
  std::ifstream f(path);
  if (!f) {
    std::cerr << "Settings file not found: " << path << "\n";
    return false;
  }
  GameplaySettings loaded = s;
  try {
    json j; f >> j;
    settingsFromJson(j, loaded);
  } catch (const json::exception& e) {
    std::cerr << "Settings " << path << ": " << e.what() << "\n";
    return false;
  }
  if (auto why = validateSettings(loaded)) {
    std::cerr << "Settings " << path << ": " << *why << "\n";
    return false;
  }
  s = loaded;
  return true;
}

std::optional<std::string> validateSettings(const GameplaySettings& s) {
  const HitWindows& w = s.windows;
  const ScoreRules& r = s.scoring;
  if (s.lanes < 1) return "lanes must be at least 1";
  if (!(s.noteSpeed > 0.0)) return "noteSpeed must be positive";
  if (s.spawnDistance < 0.0) return "spawnDistance must not be negative";
  if (!(w.hit > 0.0)) return "hitWindow must be positive";
  if (!(0.0 <= w.perfect && w.perfect <= w.great && w.great <= w.good && w.good <= w.hit))
    return "windows must satisfy 0 <= perfect <= great <= good <= hit";
  if (w.missGrace < w.hit) return "missGrace must be at least hitWindow";
  if (!(r.perfect > r.great && r.great > r.good && r.good > r.ok && r.ok > 0))
    return "scoring values must be positive and strictly decreasing from perfect to ok";
  if (r.maxMultiplier < 1) return "maxMultiplier must be at least 1";
  if (r.notesPerMultiplier < 1) return "notesPerMultiplier must be at least 1";
  if (r.sustainPerSecond < 0) return "sustainPerSecond must not be negative";
  if (s.fadeDuration < 0.0) return "fadeDuration must not be negative";
  if (s.maxClockDrift < 0.0) return "maxClockDrift must not be negative";
  if (s.sustainReleaseTolerance < 0.0) return "sustainReleaseTolerance must not be negative";
  if (!s.laneKeys.empty() && (int)s.laneKeys.size() != s.lanes)
    return "laneKeys must name one key per lane";
  return std::nullopt;
}

double travelDuration(const GameplaySettings& s) {
  return travelDuration(s.spawnDistance, s.noteSpeed);
}
