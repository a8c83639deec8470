#include "autoplay.hpp"
#include <algorithm>

AutoplayInput::AutoplayInput(const DifficultyTrack& track, double offset, double tapLength) {
  for (const auto& n : track.notes()) {
    double press = n.t + offset;
    events_.push_back({n.lane, press, true});
    events_.push_back({n.lane, n.isSustained() ? n.endTime() : press + tapLength, false});
  }
  // a release sorts before a press at the same instant so chords on one lane re-trigger
  std::stable_sort(events_.begin(), events_.end(),
    [](const InputEvent& a, const InputEvent& b) {
      if (a.time != b.time) return a.time < b.time;
      return !a.pressed && b.pressed;
    });
}

std::vector<InputEvent> AutoplayInput::due(double now) {
  std::vector<InputEvent> out;
  while (next_ < events_.size() && events_[next_].time <= now) out.push_back(events_[next_++]);
  return out;
}
