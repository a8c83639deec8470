#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "judge.hpp"
#include "score.hpp"

struct GameplaySettings {
  int lanes = 5;
  double noteSpeed = 15.0;      // units per second
  double spawnDistance = 25.0;  // units from spawn point to hit line
  HitWindows windows;
  ScoreRules scoring;
  double fadeDuration = 0.5;    // resolved notes stay visible this long
  int latencyOffsetMs = 0;
  bool interpolateClock = true;
  double maxClockDrift = 0.05;
  double sustainReleaseTolerance = 0.1;
  std::vector<std::string> laneKeys{"D", "F", "J", "K", "L"};
};

// Missing keys keep the values already in s, except that a hitWindow without
// goodWindow/missGrace resets those to hitWindow and hitWindow + 0.05.
// Throws nlohmann::json exceptions on wrongly typed values.
void settingsFromJson(const nlohmann::json& j, GameplaySettings& s);

// Returns false (and logs why) on unreadable or invalid files; s is only
// replaced when the whole file is valid.
bool loadSettings(const std::filesystem::path& path, GameplaySettings& s);

// Human readable reason when the values cannot drive a session.
std::optional<std::string> validateSettings(const GameplaySettings& s);

double travelDuration(const GameplaySettings& s);
