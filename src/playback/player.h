// Realtime transport over a compiled score.

#ifndef TUNESCRIPT_PLAYBACK_PLAYER_H
#define TUNESCRIPT_PLAYBACK_PLAYER_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "playback/synth_backend.h"
#include "playback/timed_event.h"

namespace tunescript {

/// Level sent as CC7 and CC11 on every channel when a score is loaded.
constexpr uint8_t kInitialChannelLevel = 100;

/// Player construction options.
struct PlayerOptions {
  /// Worker sleep between dispatch passes.
  std::chrono::milliseconds poll_interval{5};
  /// Start a worker thread on play(). When false the owner calls pump().
  bool use_worker_thread = true;
};

/// @brief Plays a CompiledScore through a SynthBackend with play/pause/seek.
///
/// Transport calls may come from any thread. A worker thread dispatches
/// every event whose time is at or before the transport position, then
/// sleeps for the poll interval. When the last event has been sent the
/// player stops by itself and silences all notes.
///
/// The clock is injectable so tests can advance time by hand:
/// @code
///   double now = 0.0;
///   Player player(backend, [&] { return now; }, {std::chrono::milliseconds(5), false});
///   player.load(compiled);
///   player.play();
///   now = 1.0;
///   player.pump();  // sends everything due in the first second
/// @endcode
class Player {
 public:
  /// Monotonic time source in seconds.
  using Clock = std::function<double()>;

  /// @brief Default clock backed by std::chrono::steady_clock.
  static Clock steadyClock();

  explicit Player(SynthBackend& backend, Clock clock = steadyClock(),
                  PlayerOptions options = PlayerOptions());
  ~Player();

  Player(const Player&) = delete;
  Player& operator=(const Player&) = delete;

  /// @brief Stop, replace the score and configure each channel.
  /// Sends program change (not on the kit), CC7 = 100 and CC11 = 100.
  void load(CompiledScore score);

  /// @brief Start from the current position, or resume after pause.
  /// Restarts from 0 when the previous run reached the end.
  /// @return False if nothing is loaded.
  bool play();

  /// @brief Freeze the position and silence sounding notes.
  /// @return False if not playing.
  bool pause();

  /// @brief Halt playback, silence notes and rewind to 0.
  void stop();

  /// @brief Move the transport. The position is clamped to [0, duration].
  /// @return False if nothing is loaded.
  bool seek(double seconds);

  /// @brief Send CC7 for a track's channel.
  /// @param name Track name as listed in the compiled channel table.
  /// @param volume 0.0-1.0 (clamped).
  /// @return False if no channel has that name.
  bool setTrackVolume(const std::string& name, double volume);

  /// @brief Dispatch every due event once.
  /// @return Number of events sent.
  size_t pump();

  double position() const;
  double duration() const;
  bool isLoaded() const { return loaded_.load(); }
  bool isPlaying() const { return playing_.load(); }
  bool isPaused() const { return paused_.load(); }

 private:
  double positionLocked() const;
  void silenceLocked();
  void joinWorker();
  void workerLoop();

  SynthBackend& backend_;
  Clock clock_;
  PlayerOptions options_;

  // Serializes transport calls against each other.
  std::mutex control_mutex_;
  // Guards everything below and every backend call.
  mutable std::mutex state_mutex_;
  CompiledScore score_;
  size_t next_event_ = 0;
  double anchor_position_ = 0.0;  // Transport position at anchor_clock_
  double anchor_clock_ = 0.0;
  bool finished_ = false;

  std::atomic<bool> loaded_{false};
  std::atomic<bool> playing_{false};
  std::atomic<bool> paused_{false};
  std::thread worker_;
};

}  // namespace tunescript

#endif  // TUNESCRIPT_PLAYBACK_PLAYER_H
