// Implementation of the realtime player.

#include "playback/player.h"

#include <algorithm>
#include <utility>

#include "core/log.h"
#include "core/music_tables.h"

namespace tunescript {

Player::Clock Player::steadyClock() {
  return [] {
    using Seconds = std::chrono::duration<double>;
    return std::chrono::duration_cast<Seconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
  };
}

Player::Player(SynthBackend& backend, Clock clock, PlayerOptions options)
    : backend_(backend), clock_(std::move(clock)), options_(options) {}

Player::~Player() {
  stop();
}

// ---------------------------------------------------------------------------
// Transport
// ---------------------------------------------------------------------------

void Player::load(CompiledScore score) {
  stop();

  std::lock_guard<std::mutex> control(control_mutex_);
  std::lock_guard<std::mutex> lock(state_mutex_);
  score_ = std::move(score);
  next_event_ = 0;
  anchor_position_ = 0.0;
  finished_ = false;

  for (const auto& assignment : score_.channels) {
    if (!assignment.is_drums) {
      backend_.programChange(assignment.channel, assignment.program);
    }
    backend_.controlChange(assignment.channel, kControlVolume, kInitialChannelLevel);
    backend_.controlChange(assignment.channel, kControlExpression, kInitialChannelLevel);
  }
  loaded_ = true;

  logMessage(LogLevel::Debug, "player", "loaded %zu events on %zu channels, %.2f s",
             score_.events.size(), score_.channels.size(), score_.duration_seconds);
}

bool Player::play() {
  std::lock_guard<std::mutex> control(control_mutex_);
  if (!loaded_) return false;
  if (playing_) return true;

  // A worker that ended on its own is still joinable.
  joinWorker();

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (finished_) {
      anchor_position_ = 0.0;
      next_event_ = 0;
      finished_ = false;
    }
    anchor_clock_ = clock_();
    playing_ = true;
    paused_ = false;
  }

  if (options_.use_worker_thread) {
    worker_ = std::thread(&Player::workerLoop, this);
  }
  return true;
}

bool Player::pause() {
  std::lock_guard<std::mutex> control(control_mutex_);
  if (!playing_) return false;

  bool paused = false;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    // The worker may have reached the end in the meantime.
    if (playing_) {
      anchor_position_ = positionLocked();
      playing_ = false;
      paused_ = true;
      paused = true;
      silenceLocked();
    }
  }
  joinWorker();
  return paused;
}

void Player::stop() {
  std::lock_guard<std::mutex> control(control_mutex_);
  playing_ = false;
  paused_ = false;
  joinWorker();

  std::lock_guard<std::mutex> lock(state_mutex_);
  anchor_position_ = 0.0;
  next_event_ = 0;
  finished_ = false;
  if (loaded_) silenceLocked();
}

bool Player::seek(double seconds) {
  std::lock_guard<std::mutex> control(control_mutex_);
  if (!loaded_) return false;

  std::lock_guard<std::mutex> lock(state_mutex_);
  double target = std::clamp(seconds, 0.0, score_.duration_seconds);
  anchor_position_ = target;
  anchor_clock_ = clock_();
  finished_ = false;

  auto first_due = std::lower_bound(
      score_.events.begin(), score_.events.end(), target,
      [](const TimedEvent& event, double time) { return event.time_seconds < time; });
  next_event_ = static_cast<size_t>(first_due - score_.events.begin());
  silenceLocked();
  return true;
}

bool Player::setTrackVolume(const std::string& name, double volume) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  const ChannelAssignment* assignment = score_.findChannel(name);
  if (assignment == nullptr) return false;
  backend_.controlChange(assignment->channel, kControlVolume,
                         velocityToMidi(std::clamp(volume, 0.0, 1.0)));
  return true;
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

size_t Player::pump() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (!playing_) return 0;

  const double now = positionLocked();
  const auto& events = score_.events;
  size_t sent = 0;

  while (next_event_ < events.size() && events[next_event_].time_seconds <= now) {
    const TimedEvent& event = events[next_event_++];
    if (event.kind == TimedEventKind::NoteOn) {
      backend_.noteOn(event.channel, event.pitch, event.velocity);
    } else {
      backend_.noteOff(event.channel, event.pitch);
    }
    ++sent;
  }

  if (next_event_ >= events.size()) {
    anchor_position_ = std::min(now, score_.duration_seconds);
    finished_ = true;
    playing_ = false;
    silenceLocked();
    logMessage(LogLevel::Debug, "player", "playback finished at %.2f s", anchor_position_);
  }
  return sent;
}

double Player::position() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return std::min(positionLocked(), score_.duration_seconds);
}

double Player::duration() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return score_.duration_seconds;
}

double Player::positionLocked() const {
  if (!playing_) return anchor_position_;
  // Unclamped: drum releases may fall after the nominal end.
  return anchor_position_ + (clock_() - anchor_clock_);
}

void Player::silenceLocked() {
  backend_.allNotesOff();
}

void Player::joinWorker() {
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  }
}

void Player::workerLoop() {
  while (playing_) {
    pump();
    std::this_thread::sleep_for(options_.poll_interval);
  }
}

}  // namespace tunescript
