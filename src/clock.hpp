#pragma once
#include <optional>

// Playback position supplied by whatever plays the song.
class AudioClock {
public:
  virtual ~AudioClock() = default;
  virtual double playbackTime() const = 0; // seconds
  virtual bool isPlaying() const = 0;
  virtual double length() const { return 0.0; } // 0 when unknown
  virtual void setPaused(bool) {}
  virtual void restart() {}
};

// Clock driven by hand: tests, replays and offline runs.
class ManualClock : public AudioClock {
public:
  explicit ManualClock(double length = 0.0) : length_(length) {}
  double playbackTime() const override { return time_; }
  bool isPlaying() const override { return playing_; }
  double length() const override { return length_; }
  void setPaused(bool paused) override { paused_ = paused; }
  void restart() override { time_ = 0.0; playing_ = true; }

  // Ignored while paused, like a paused audio stream.
  void set(double t) { if (!paused_) time_ = t; }
  void stop() { playing_ = false; }
  bool paused() const { return paused_; }

private:
  double time_ = 0.0;
  double length_ = 0.0;
  bool playing_ = true;
  bool paused_ = false;
};

struct ClockTuning {
  double offsetSeconds = 0.0; // latency calibration, added to playback time
  bool interpolate = true;
  double maxDrift = 0.05;     // interpolation never runs further ahead of the audio
};

// Session time: audio position plus calibration, smoothed between the coarse
// position updates audio backends report, and never running backwards except
// through reset(). Frozen while paused.
class SessionClock {
public:
  SessionClock(const AudioClock& audio, ClockTuning tuning);

  // Reads the audio clock at host time hostNow (seconds, any epoch).
  double sample(double hostNow);
  // What sample() would return, without touching any state.
  double peek(double hostNow) const;
  double now() const { return last_.value_or(0.0); }

  void setPaused(bool paused, double hostNow);
  bool paused() const { return paused_; }
  void setOffset(double seconds) { tuning_.offsetSeconds = seconds; }
  double offset() const { return tuning_.offsetSeconds; }
  void reset();

private:
  const AudioClock& audio_;
  ClockTuning tuning_;
  bool paused_ = false;
  std::optional<double> last_;  // last value handed out
  double lastRaw_ = 0.0;        // audio position at the last change
  double lastHost_ = -1.0;      // host time of that change, < 0 before the first sample
  double rate_ = 1.0;           // estimated playback seconds per host second
};
