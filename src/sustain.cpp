#include "sustain.hpp"
#include <algorithm>

std::vector<HoldResult> SustainTracker::begin(size_t note, int lane, double pressTime, double end,
                                              double tolerance) {
  std::vector<HoldResult> ended = release(lane, pressTime, tolerance);
  holds_.push_back({note, lane, pressTime, end});
  return ended;
}

std::vector<HoldResult> SustainTracker::release(int lane, double now, double tolerance) {
  std::vector<HoldResult> out;
  for (auto it = holds_.begin(); it != holds_.end();) {
    if (it->lane != lane) { ++it; continue; }
    HoldResult r;
    r.note = it->note;
    r.lane = it->lane;
    r.completed = now >= it->end - tolerance;
    r.heldSeconds = std::max(0.0, std::min(now, it->end) - it->start);
    if (r.completed) r.heldSeconds = it->end - it->start;
    out.push_back(r);
    it = holds_.erase(it);
  }
  return out;
}

std::vector<HoldResult> SustainTracker::update(double now) {
  std::vector<HoldResult> out;
  for (auto it = holds_.begin(); it != holds_.end();) {
    if (now < it->end) { ++it; continue; }
    out.push_back({it->note, it->lane, it->end - it->start, true});
    it = holds_.erase(it);
  }
  return out;
}
