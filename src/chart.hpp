#pragma once
#include <vector>
#include <string>
#include <map>
#include <optional>
#include <filesystem>
#include <stdexcept>
#include <cstddef>
#include <iosfwd>

// Thrown by every chart loader. line is 0 when the failure has no line.
struct ParseError : std::runtime_error {
  ParseError(const std::string& what, int line = 0);
  int line = 0;
};

enum class Accuracy { Perfect, Great, Good, Ok };
enum class NoteStatus { Pending, Spawned, Hit, Missed };

const char* accuracyName(Accuracy a);
const char* statusName(NoteStatus s);

struct NoteRecord {
  size_t index = 0;       // position in the owning track, never changes
  int    lane = 0;        // 0..lanes-1
  double t = 0.0;         // target hit time, seconds
  double duration = 0.0;  // sustain length, 0 for a tap note
  NoteStatus status = NoteStatus::Pending;
  std::optional<Accuracy> accuracy;
  double spawnedAt  = -1.0;
  double resolvedAt = -1.0;
  double expiresAt  = -1.0; // presentation may drop the note after this

  bool isSustained() const { return duration > 0.0; }
  bool isResolved() const { return status == NoteStatus::Hit || status == NoteStatus::Missed; }
  double endTime() const { return t + duration; }
};

// Raw note as it comes out of a parser, before indices are assigned.
struct NoteEvent {
  int lane = 0;
  double t = 0.0;
  double duration = 0.0;
};

struct ChartInfo {
  std::string songName = "Unknown Song";
  std::string artist = "Unknown Artist";
  std::string charter;
  double offset = 0.0;   // seconds added to every note
  int resolution = 192;  // ticks per beat (.chart only)
};

struct Song {
  ChartInfo info;
  // Keyed by difficulty name as written in the source ("Expert", "Hard", ...)
  std::map<std::string, std::vector<NoteEvent>> difficulties;
};

// One difficulty of one song. Notes are ordered by (t, lane, source order)
// and NoteRecord::index equals the position in notes. Status changes only go
// through the mark* functions.
class DifficultyTrack {
public:
  DifficultyTrack() = default;
  DifficultyTrack(std::string difficulty, std::vector<NoteEvent> events);

  const std::string& difficulty() const { return difficulty_; }
  const std::vector<NoteRecord>& notes() const { return notes_; }
  const NoteRecord& note(size_t idx) const { return notes_.at(idx); }
  size_t size() const { return notes_.size(); }
  bool empty() const { return notes_.empty(); }

  // Latest t + duration over all notes, 0 when empty.
  double lastNoteEnd() const;
  size_t countWithStatus(NoteStatus s) const;

  // Pending -> Spawned -> {Hit | Missed}. Anything else throws std::logic_error.
  void markSpawned(size_t idx, double now);
  void markHit(size_t idx, Accuracy acc, double now, double fade);
  void markMissed(size_t idx, double now, double fade);

  void clear() { notes_.clear(); }

private:
  NoteRecord& mutableNote(size_t idx, NoteStatus expected, NoteStatus next);

  std::string difficulty_;
  std::vector<NoteRecord> notes_;
};

struct LoadedChart {
  ChartInfo info;
  DifficultyTrack track;
};

// Loaders for the supported formats. All throw ParseError.
Song loadSongText(std::istream& in);
Song loadSongText(const std::filesystem::path& path);
Song loadSongJson(const std::filesystem::path& path);
Song loadSong(const std::filesystem::path& path);

// Picks one difficulty ("Expert" and "ExpertSingle" both match, any case).
// Throws ParseError if it is absent, empty, or has a lane outside 0..lanes-1.
DifficultyTrack selectDifficulty(const Song& song, const std::string& difficulty, int lanes);
LoadedChart loadChart(const std::filesystem::path& path, const std::string& difficulty, int lanes);
