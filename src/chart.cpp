#include "chart.hpp"
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

ParseError::ParseError(const std::string& what, int line)
  : std::runtime_error(line > 0 ? "line " + std::to_string(line) + ": " + what : what),
    line(line) {}

const char* accuracyName(Accuracy a) {
  switch (a) {
    case Accuracy::Perfect: return "Perfect";
    case Accuracy::Great:   return "Great";
    case Accuracy::Good:    return "Good";
    case Accuracy::Ok:      return "Ok";
  }
  return "?";
}

const char* statusName(NoteStatus s) {
  switch (s) {
    case NoteStatus::Pending: return "Pending";
    case NoteStatus::Spawned: return "Spawned";
    case NoteStatus::Hit:     return "Hit";
    case NoteStatus::Missed:  return "Missed";
  }
  return "?";
}

// --------- DifficultyTrack ---------
DifficultyTrack::DifficultyTrack(std::string difficulty, std::vector<NoteEvent> events)
  : difficulty_(std::move(difficulty)) {
  std::stable_sort(events.begin(), events.end(),
    [](const NoteEvent& a, const NoteEvent& b) {
      if (a.t != b.t) return a.t < b.t;
      return a.lane < b.lane;
    });
  notes_.reserve(events.size());
  for (const auto& e : events) {
    NoteRecord n;
    n.index = notes_.size();
    n.lane = e.lane;
    n.t = e.t;
    n.duration = std::max(0.0, e.duration);
    notes_.push_back(n);
  }
}

double DifficultyTrack::lastNoteEnd() const {
  double end = 0.0;
  for (const auto& n : notes_) end = std::max(end, n.endTime());
  return end;
}

size_t DifficultyTrack::countWithStatus(NoteStatus s) const {
  return (size_t)std::count_if(notes_.begin(), notes_.end(),
    [s](const NoteRecord& n){ return n.status == s; });
}

NoteRecord& DifficultyTrack::mutableNote(size_t idx, NoteStatus expected, NoteStatus next) {
  if (idx >= notes_.size())
    throw std::logic_error("note index " + std::to_string(idx) + " out of range");
  NoteRecord& n = notes_[idx];
  if (n.status != expected) {
    throw std::logic_error(std::string("note ") + std::to_string(idx) + ": illegal transition " +
                           statusName(n.status) + " -> " + statusName(next));
  }
  n.status = next;
  return n;
}

void DifficultyTrack::markSpawned(size_t idx, double now) {
  mutableNote(idx, NoteStatus::Pending, NoteStatus::Spawned).spawnedAt = now;
}

void DifficultyTrack::markHit(size_t idx, Accuracy acc, double now, double fade) {
  NoteRecord& n = mutableNote(idx, NoteStatus::Spawned, NoteStatus::Hit);
  n.accuracy = acc;
  n.resolvedAt = now;
  // a held sustain stays on screen until its tail has passed
  n.expiresAt = std::max(now, n.endTime()) + fade;
}

void DifficultyTrack::markMissed(size_t idx, double now, double fade) {
  NoteRecord& n = mutableNote(idx, NoteStatus::Spawned, NoteStatus::Missed);
  n.resolvedAt = now;
  n.expiresAt = now + fade;
}

// --------- Loading ---------
static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return (char)std::tolower(c); });
  return s;
}

Song loadSong(const fs::path& path) {
  if (!fs::exists(path)) throw ParseError("chart file not found: " + path.string());
  std::string ext = lower(path.extension().string());
  if (ext == ".json") return loadSongJson(path);
  if (ext == ".chart") return loadSongText(path);
  throw ParseError("unsupported chart format: " + path.string());
}

DifficultyTrack selectDifficulty(const Song& song, const std::string& difficulty, int lanes) {
  const std::string want = lower(difficulty);
  const std::vector<NoteEvent>* events = nullptr;
  std::string name;
  for (const auto& [key, notes] : song.difficulties) {
    std::string k = lower(key);
    if (k == want || k == want + "single") { events = &notes; name = key; break; }
  }
  if (!events) throw ParseError("difficulty not found: " + difficulty);
  if (events->empty()) throw ParseError("difficulty has no notes: " + difficulty);
  for (const auto& e : *events) {
    if (e.lane < 0 || e.lane >= lanes)
      throw ParseError("lane " + std::to_string(e.lane) + " out of range in " + name);
  }
  return DifficultyTrack(name, *events);
}

LoadedChart loadChart(const fs::path& path, const std::string& difficulty, int lanes) {
  Song song = loadSong(path);
  LoadedChart out;
  out.track = selectDifficulty(song, difficulty, lanes);
  out.info = song.info;
  return out;
}
