#include "session.hpp"
#include "judge.hpp"
#include "sweeper.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace {

AudioClock* requireClock(AudioClock* audio) {
  if (!audio) throw std::invalid_argument("session needs an audio clock");
  return audio;
}

ClockTuning tuningFor(const GameplaySettings& s) {
  ClockTuning t;
  t.offsetSeconds = s.latencyOffsetMs / 1000.0;
  t.interpolate = s.interpolateClock;
  t.maxDrift = s.maxClockDrift;
  return t;
}

double steadySeconds() {
  using namespace std::chrono;
  return duration<double>(steady_clock::now().time_since_epoch()).count();
}

} // namespace

Session::Session(const DifficultyTrack& track, ChartInfo info, GameplaySettings settings,
                 AudioClock* audio, PresentationSink& sink)
  : pristine_(track),
    track_(track),
    info_(std::move(info)),
    settings_(std::move(settings)),
    audio_(requireClock(audio)),
    sink_(sink),
    clock_(*audio_, tuningFor(settings_)),
    hostTime_(steadySeconds) {
  if (track_.empty()) throw std::invalid_argument("session needs at least one note");
  if (auto why = validateSettings(settings_)) throw std::invalid_argument(*why);
  for (const auto& n : track_.notes()) {
    if (n.status != NoteStatus::Pending)
      throw std::invalid_argument("session needs an unplayed track");
    if (n.lane < 0 || n.lane >= settings_.lanes)
      throw std::invalid_argument("note lane outside the configured lanes");
  }
}

double Session::hostNow() const { return hostTime_(); }

void Session::setHostTimeSource(std::function<double()> source) {
  std::lock_guard<std::mutex> lock(mu_);
  hostTime_ = source ? std::move(source) : std::function<double()>(steadySeconds);
}

// --------- Tick ---------
std::vector<GameEvent> Session::tick() {
  TickOutput out;
  {
    std::lock_guard<std::mutex> lock(mu_);
    out = tickLocked();
  }
  for (const auto& e : out.events) sink_.onEvent(e);
  if (out.finalized) sink_.onSessionFinalized(*out.finalized);
  return std::move(out.events);
}

Session::TickOutput Session::tickLocked() {
  TickOutput out;
  if (results_ || tornDown_ || clock_.paused()) return out;

  const double now = clock_.sample(hostNow());
  auto& events = out.events;

  spawnDue(now, events);

  // everything pressed before this tick is judged before anything is swept
  std::vector<InputEvent> inputs;
  inputs.swap(inputs_);
  for (const auto& in : inputs) handleInput(in, now, events);

  for (const auto& r : holds_.update(now)) finishHold(r, now, events);

  for (size_t idx : sweep(track_, active_, now, settings_.windows.missGrace, settings_.fadeDuration))
    reportMiss(idx, now, events);

  expireFaded(now, events);

  if (audioEnded() && !songOver(now)) flushRemaining(now, events);
  if (songOver(now) || audioEnded()) {
    results_ = buildResults();
    fading_.clear();
    out.finalized = results_;
  }
  return out;
}

void Session::spawnDue(double now, std::vector<GameEvent>& out) {
  for (size_t idx : advance(track_, timeline_, active_, now, travelDuration(settings_))) {
    GameEvent e;
    e.kind = EventKind::NoteSpawned;
    e.time = now;
    e.note = idx;
    e.lane = track_.note(idx).lane;
    out.push_back(e);
  }
}

void Session::handleInput(const InputEvent& in, double now, std::vector<GameEvent>& out) {
  const double t = std::min(in.time, now);
  const double tol = settings_.sustainReleaseTolerance;

  if (!in.pressed) {
    for (const auto& r : holds_.release(in.lane, t, tol)) finishHold(r, now, out);
    return;
  }

  const ScoreState before = score_;
  JudgeOutcome o = judge(track_, active_, in.lane, t, settings_.windows, settings_.fadeDuration);
  GameEvent e;
  e.time = now;
  e.lane = in.lane;
  if (!o.hit) {
    applyMiss(score_);
    e.kind = EventKind::Whiff;
    out.push_back(e);
    publishScore(before, now, out);
    return;
  }

  applyHit(score_, settings_.scoring, o.accuracy);
  fading_.push_back(o.note);
  e.kind = EventKind::NoteHit;
  e.note = o.note;
  e.accuracy = o.accuracy;
  e.offset = o.offset;
  out.push_back(e);
  publishScore(before, now, out);

  const NoteRecord& n = track_.note(o.note);
  if (n.isSustained()) {
    for (const auto& r : holds_.begin(o.note, n.lane, std::max(t, n.t), n.endTime(), tol))
      finishHold(r, now, out);
  }
}

void Session::finishHold(const HoldResult& r, double now, std::vector<GameEvent>& out) {
  const ScoreState before = score_;
  GameEvent e;
  e.kind = r.completed ? EventKind::SustainCompleted : EventKind::SustainBroken;
  e.time = now;
  e.note = r.note;
  e.lane = r.lane;
  e.value = applySustainBonus(score_, settings_.scoring, r.heldSeconds);
  out.push_back(e);
  publishScore(before, now, out);
}

void Session::reportMiss(size_t idx, double now, std::vector<GameEvent>& out) {
  const ScoreState before = score_;
  applyMiss(score_);
  fading_.push_back(idx);
  GameEvent e;
  e.kind = EventKind::NoteMissed;
  e.time = now;
  e.note = idx;
  e.lane = track_.note(idx).lane;
  out.push_back(e);
  publishScore(before, now, out);
}

void Session::publishScore(const ScoreState& before, double now, std::vector<GameEvent>& out) const {
  auto push = [&](EventKind kind, int64_t value) {
    GameEvent e;
    e.kind = kind;
    e.time = now;
    e.value = value;
    out.push_back(e);
  };
  if (score_.score != before.score) push(EventKind::ScoreChanged, score_.score);
  if (score_.combo != before.combo) push(EventKind::ComboChanged, score_.combo);
  if (score_.multiplier != before.multiplier) push(EventKind::MultiplierChanged, score_.multiplier);
}

void Session::expireFaded(double now, std::vector<GameEvent>& out) {
  auto it = std::stable_partition(fading_.begin(), fading_.end(),
    [&](size_t idx){ return track_.note(idx).expiresAt > now; });
  for (auto e = it; e != fading_.end(); ++e) {
    GameEvent ev;
    ev.kind = EventKind::NoteExpired;
    ev.time = now;
    ev.note = *e;
    ev.lane = track_.note(*e).lane;
    out.push_back(ev);
  }
  fading_.erase(it, fading_.end());
}

// --------- Song end ---------
bool Session::songOver(double now) const {
  if (!active_.empty() || !holds_.empty()) return false;
  if (track_.countWithStatus(NoteStatus::Pending) != 0) return false;
  const double end = std::max(track_.lastNoteEnd() + settings_.windows.missGrace, audio_->length());
  return now >= end;
}

bool Session::audioEnded() const {
  const double len = audio_->length();
  return len > 0.0 && !audio_->isPlaying() && audio_->playbackTime() >= len;
}

// The audio is over but the chart is not: what is left can no longer be played.
void Session::flushRemaining(double now, std::vector<GameEvent>& out) {
  for (size_t i = 0; i < track_.size(); ++i) {
    if (track_.note(i).status != NoteStatus::Pending) continue;
    track_.markSpawned(i, now);
    active_.insert(i);
    GameEvent e;
    e.kind = EventKind::NoteSpawned;
    e.time = now;
    e.note = i;
    e.lane = track_.note(i).lane;
    out.push_back(e);
  }
  std::vector<size_t> left(active_.begin(), active_.end());
  for (size_t idx : left) {
    track_.markMissed(idx, now, settings_.fadeDuration);
    active_.erase(idx);
    reportMiss(idx, now, out);
  }
  for (int lane = 0; lane < settings_.lanes; ++lane) {
    for (const auto& r : holds_.release(lane, now, settings_.sustainReleaseTolerance))
      finishHold(r, now, out);
  }
}

ResultsSummary Session::buildResults() const {
  ResultsSummary r;
  r.song = info_.songName;
  r.artist = info_.artist;
  r.difficulty = track_.difficulty();
  r.finalScore = score_.score;
  r.accuracyPercent = accuracyPercent(score_);
  r.maxCombo = score_.maxCombo;
  r.perfectCount = score_.perfect;
  r.greatCount = score_.great;
  r.goodCount = score_.good;
  r.okCount = score_.ok;
  r.missedCount = score_.misses;
  r.totalNotes = (int)track_.size();
  if (r.totalNotes > 0)
    r.completionPercent = (double)track_.countWithStatus(NoteStatus::Hit) / r.totalNotes * 100.0;
  return r;
}

// --------- Control ---------
bool Session::submitInput(const InputEvent& in) {
  std::lock_guard<std::mutex> lock(mu_);
  if (results_ || tornDown_ || clock_.paused()) return false;
  if (in.lane < 0 || in.lane >= settings_.lanes) return false;
  inputs_.push_back(in);
  return true;
}

double Session::currentTime() const {
  std::lock_guard<std::mutex> lock(mu_);
  return clock_.peek(hostNow());
}

void Session::pause() {
  std::lock_guard<std::mutex> lock(mu_);
  if (results_ || tornDown_ || clock_.paused()) return;
  clock_.setPaused(true, hostNow());
  audio_->setPaused(true);
}

void Session::resume() {
  std::lock_guard<std::mutex> lock(mu_);
  if (results_ || tornDown_ || !clock_.paused()) return;
  audio_->setPaused(false);
  clock_.setPaused(false, hostNow());
}

bool Session::paused() const {
  std::lock_guard<std::mutex> lock(mu_);
  return clock_.paused();
}

bool Session::restart() {
  std::lock_guard<std::mutex> lock(mu_);
  if (results_ || tornDown_) return false;
  track_ = pristine_;
  timeline_ = Timeline{};
  active_.clear();
  holds_.clear();
  score_ = ScoreState{};
  inputs_.clear();
  fading_.clear();
  audio_->setPaused(false);
  audio_->restart();
  clock_.reset();
  return true;
}

void Session::teardown() {
  std::lock_guard<std::mutex> lock(mu_);
  tornDown_ = true;
  track_.clear();
  pristine_.clear();
  active_.clear();
  holds_.clear();
  inputs_.clear();
  fading_.clear();
}

bool Session::setNoteSpeed(double speed) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!(speed > 0.0)) return false;
  settings_.noteSpeed = speed;
  return true;
}

double Session::noteSpeed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return settings_.noteSpeed;
}

void Session::setLatencyOffsetMs(int ms) {
  std::lock_guard<std::mutex> lock(mu_);
  settings_.latencyOffsetMs = ms;
  clock_.setOffset(ms / 1000.0);
}

int Session::latencyOffsetMs() const {
  std::lock_guard<std::mutex> lock(mu_);
  return settings_.latencyOffsetMs;
}

bool Session::finalized() const {
  std::lock_guard<std::mutex> lock(mu_);
  return results_.has_value();
}

std::optional<ResultsSummary> Session::results() const {
  std::lock_guard<std::mutex> lock(mu_);
  return results_;
}

ScoreState Session::score() const {
  std::lock_guard<std::mutex> lock(mu_);
  return score_;
}

NoteRecord Session::note(size_t idx) const {
  std::lock_guard<std::mutex> lock(mu_);
  return track_.note(idx);
}

size_t Session::noteCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return track_.size();
}

size_t Session::activeCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return active_.size();
}
