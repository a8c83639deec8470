#pragma once
#include <string>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>

struct ResultsSummary {
  std::string song;
  std::string artist;
  std::string difficulty;
  int64_t finalScore = 0;
  double accuracyPercent = 0.0;
  int maxCombo = 0;
  int perfectCount = 0;
  int greatCount = 0;
  int goodCount = 0;
  int okCount = 0;
  int missedCount = 0;
  int totalNotes = 0;
  double completionPercent = 0.0; // chart notes resolved by a hit
};

nlohmann::json resultsToJson(const ResultsSummary& r);
bool writeResults(const std::filesystem::path& path, const ResultsSummary& r);
