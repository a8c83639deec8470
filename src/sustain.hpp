#pragma once
#include <vector>
#include <cstddef>

struct Hold {
  size_t note = 0;
  int lane = 0;
  double start = 0.0; // press time of the head
  double end = 0.0;   // t + duration
};

struct HoldResult {
  size_t note = 0;
  int lane = 0;
  double heldSeconds = 0.0;
  bool completed = false;
};

// Sustain tails whose head was hit and whose lane is still held.
class SustainTracker {
public:
  // A press that starts a new hold ends any previous hold on the same lane.
  std::vector<HoldResult> begin(size_t note, int lane, double pressTime, double end, double tolerance);
  // Releasing within tolerance of the tail end still counts as completed.
  std::vector<HoldResult> release(int lane, double now, double tolerance);
  // Completes every hold whose end has been reached.
  std::vector<HoldResult> update(double now);

  bool empty() const { return holds_.empty(); }
  size_t size() const { return holds_.size(); }
  void clear() { holds_.clear(); }

private:
  std::vector<Hold> holds_;
};
