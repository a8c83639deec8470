#include "clock.hpp"
#include <algorithm>

SessionClock::SessionClock(const AudioClock& audio, ClockTuning tuning)
  : audio_(audio), tuning_(tuning) {}

double SessionClock::sample(double hostNow) {
  if (paused_) return now();

  const double raw = audio_.playbackTime();
  double pos = raw;

  if (!tuning_.interpolate || !audio_.isPlaying() || lastHost_ < 0.0) {
    lastRaw_ = raw;
    lastHost_ = hostNow;
  } else if (raw != lastRaw_) {
    const double dt = hostNow - lastHost_;
    // too close together to say anything about the rate
    if (dt > 0.005) {
      double rate = raw >= lastRaw_ ? (raw - lastRaw_) / dt : rate_;
      if (rate < 0.8 || rate > 1.2) rate = 0.7 + rate * 0.3;
      rate_ = rate_ * 0.6 + rate * 0.4;
    }
    lastRaw_ = raw;
    lastHost_ = hostNow;
  } else {
    const double since = hostNow - lastHost_;
    if (since > 0.1) rate_ = rate_ * 0.95 + 0.05;
    pos = lastRaw_ + std::max(0.0, since) * rate_;
    // a stalled stream must not be outrun
    pos = std::min(pos, raw + tuning_.maxDrift);
  }

  double value = pos + tuning_.offsetSeconds;
  if (last_ && value < *last_) value = *last_;
  last_ = value;
  return value;
}

double SessionClock::peek(double hostNow) const {
  SessionClock copy(*this);
  return copy.sample(hostNow);
}

void SessionClock::setPaused(bool paused, double hostNow) {
  if (paused == paused_) return;
  if (paused) {
    sample(hostNow);
    paused_ = true;
  } else {
    paused_ = false;
    // the pause gap is not playback time
    lastHost_ = -1.0;
  }
}

void SessionClock::reset() {
  paused_ = false;
  last_.reset();
  lastRaw_ = 0.0;
  lastHost_ = -1.0;
  rate_ = 1.0;
}
