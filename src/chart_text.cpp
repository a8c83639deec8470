#include "chart.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdint>
#include <cctype>

namespace fs = std::filesystem;

// Line-oriented .chart files:
//
//   [Song]
//   {
//     Name = "Title"
//     Resolution = 192
//   }
//   [SyncTrack]
//   {
//     0 = B 120000
//   }
//   [ExpertSingle]
//   {
//     768 = N 0 0
//   }

namespace {

struct TempoEvent {
  int64_t tick;
  double bpm;
};

struct RawNote {
  int64_t tick;
  int lane;
  int64_t sustainTicks;
};

inline std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace((unsigned char)s[b])) ++b;
  while (e > b && std::isspace((unsigned char)s[e-1])) --e;
  return s.substr(b, e - b);
}

inline std::string unquote(const std::string& s) {
  if (s.size() >= 2 && s.front() == '"' && s.back() == '"') return s.substr(1, s.size() - 2);
  return s;
}

// "key = value" -> {key, value}
bool splitKeyValue(const std::string& line, std::string& key, std::string& value) {
  size_t eq = line.find('=');
  if (eq == std::string::npos) return false;
  key = trim(line.substr(0, eq));
  value = trim(line.substr(eq + 1));
  return !key.empty();
}

int64_t parseTick(const std::string& s, int lineNo) {
  try {
    size_t used = 0;
    long long v = std::stoll(s, &used);
    if (used != s.size() || v < 0) throw ParseError("bad tick '" + s + "'", lineNo);
    return v;
  } catch (const std::logic_error&) {
    throw ParseError("bad tick '" + s + "'", lineNo);
  }
}

double tickToSeconds(int64_t tick, const std::vector<TempoEvent>& tempo, int resolution) {
  double seconds = 0.0;
  int64_t curTick = 0;
  double curBpm = tempo.empty() ? 120.0 : tempo.front().bpm;
  for (const auto& ev : tempo) {
    if (ev.tick > tick) break;
    seconds += (double)(ev.tick - curTick) / resolution * 60.0 / curBpm;
    curTick = ev.tick;
    curBpm = ev.bpm;
  }
  return seconds + (double)(tick - curTick) / resolution * 60.0 / curBpm;
}

} // namespace

Song loadSongText(std::istream& in) {
  Song song;
  bool haveSong = false;
  std::vector<TempoEvent> tempo;
  std::map<std::string, std::vector<RawNote>> raw;

  enum class State { Outside, ExpectOpen, Inside };
  State state = State::Outside;
  std::string section;
  int lineNo = 0;
  std::string line;

  while (std::getline(in, line)) {
    ++lineNo;
    if (lineNo == 1 && line.size() >= 3 &&
        (unsigned char)line[0] == 0xEF && (unsigned char)line[1] == 0xBB && (unsigned char)line[2] == 0xBF) {
      line = line.substr(3);
    }
    line = trim(line);
    if (line.empty()) continue;

    if (state == State::Outside) {
      if (line.front() != '[' || line.back() != ']' || line.size() < 3)
        throw ParseError("expected section header, got '" + line + "'", lineNo);
      section = line.substr(1, line.size() - 2);
      state = State::ExpectOpen;
      continue;
    }
    if (state == State::ExpectOpen) {
      if (line != "{") throw ParseError("expected '{' after [" + section + "]", lineNo);
      state = State::Inside;
      if (section == "Song") haveSong = true;
      else if (section != "SyncTrack" && section != "Events") raw[section];
      continue;
    }

    if (line == "}") { state = State::Outside; continue; }

    std::string key, value;
    if (!splitKeyValue(line, key, value))
      throw ParseError("malformed line in [" + section + "]: '" + line + "'", lineNo);

    if (section == "Song") {
      try {
        if (key == "Name") song.info.songName = unquote(value);
        else if (key == "Artist") song.info.artist = unquote(value);
        else if (key == "Charter") song.info.charter = unquote(value);
        else if (key == "Offset") song.info.offset = std::stod(value);
        else if (key == "Resolution") song.info.resolution = std::stoi(value);
      } catch (const std::logic_error&) {
        throw ParseError("bad value for " + key + ": '" + value + "'", lineNo);
      }
      if (song.info.resolution <= 0) throw ParseError("Resolution must be positive", lineNo);
    } else if (section == "SyncTrack") {
      int64_t tick = parseTick(key, lineNo);
      std::istringstream ss(value);
      std::string type;
      ss >> type;
      if (type == "B") {
        long long milliBpm = 0;
        if (!(ss >> milliBpm) || milliBpm <= 0)
          throw ParseError("tempo must be positive", lineNo);
        tempo.push_back({tick, milliBpm / 1000.0});
      } else if (type != "TS" && type != "A") {
        throw ParseError("unknown sync event '" + type + "'", lineNo);
      }
    } else if (section == "Events") {
      // lyrics, sections, practice markers: nothing gameplay needs
    } else {
      int64_t tick = parseTick(key, lineNo);
      std::istringstream ss(value);
      std::string type;
      ss >> type;
      if (type == "N") {
        int fret = -1;
        long long len = -1;
        if (!(ss >> fret >> len) || fret < 0 || len < 0)
          throw ParseError("malformed note '" + value + "'", lineNo);
        if (fret == 5 || fret == 6 || fret == 7) continue; // forced/tap flags, open note
        if (fret > 7) throw ParseError("unknown note value " + std::to_string(fret), lineNo);
        raw[section].push_back({tick, fret, len});
      } else if (type != "S" && type != "E") {
        throw ParseError("unknown track event '" + type + "'", lineNo);
      }
    }
  }

  if (state != State::Outside) throw ParseError("unterminated section [" + section + "]", lineNo);
  if (!haveSong) throw ParseError("missing [Song] section");

  std::stable_sort(tempo.begin(), tempo.end(),
                   [](const TempoEvent& a, const TempoEvent& b){ return a.tick < b.tick; });

  const int res = song.info.resolution;
  for (auto& [name, notes] : raw) {
    auto& out = song.difficulties[name];
    out.reserve(notes.size());
    for (const auto& n : notes) {
      NoteEvent e;
      e.lane = n.lane;
      e.t = tickToSeconds(n.tick, tempo, res) + song.info.offset;
      if (n.sustainTicks > 0)
        e.duration = tickToSeconds(n.tick + n.sustainTicks, tempo, res) + song.info.offset - e.t;
      out.push_back(e);
    }
  }
  return song;
}

Song loadSongText(const fs::path& path) {
  std::ifstream f(path);
  if (!f) throw ParseError("cannot open chart: " + path.string());
  return loadSongText(f);
}
