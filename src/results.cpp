#include "results.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>

using json = nlohmann::json;

json resultsToJson(const ResultsSummary& r) {
  json j;
  j["song"] = r.song;
  j["artist"] = r.artist;
  j["difficulty"] = r.difficulty;
  j["finalScore"] = r.finalScore;
  j["accuracyPercent"] = r.accuracyPercent;
  j["maxCombo"] = r.maxCombo;
  j["perfectCount"] = r.perfectCount;
  j["greatCount"] = r.greatCount;
  j["goodCount"] = r.goodCount;
  j["okCount"] = r.okCount;
  j["missedCount"] = r.missedCount;
  j["totalNotes"] = r.totalNotes;
  j["completionPercent"] = r.completionPercent;
  return j;
}

bool writeResults(const std::filesystem::path& path, const ResultsSummary& r) {
  std::ofstream f(path);
  if (!f) {
    std::cerr << "Cannot write results to " << path << "\n";
    return false;
  }
  f << std::setw(2) << resultsToJson(r) << "\n";
  return (bool)f;
}
