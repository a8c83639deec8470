#pragma once
#include <vector>
#include <cstddef>
#include "chart.hpp"
#include "session.hpp"

// Input provider that plays a track by itself: a press on every note's
// target time (shifted by offset) and a release at the end of its sustain,
// or tapLength after a tap note.
class AutoplayInput {
public:
  explicit AutoplayInput(const DifficultyTrack& track, double offset = 0.0, double tapLength = 0.05);

  // Events with time <= now not handed out yet, in time order.
  std::vector<InputEvent> due(double now);
  bool done() const { return next_ >= events_.size(); }
  void rewind() { next_ = 0; }

private:
  std::vector<InputEvent> events_;
  size_t next_ = 0;
};
