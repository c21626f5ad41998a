// Score model: the structured form of a parsed song.

#ifndef TUNESCRIPT_CORE_SCORE_H
#define TUNESCRIPT_CORE_SCORE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tunescript {

/// Score time unit: one quarter note at the song tempo.
using Beat = double;

/// The DSL always assumes 4/4 regardless of the declared time signature.
constexpr int kBeatsPerBar = 4;

/// Model defaults.
constexpr int kDefaultTempo = 120;
constexpr int kDefaultSectionBars = 8;
constexpr double kDefaultNoteVelocity = 0.7;
constexpr double kDefaultHitVelocity = 0.8;
constexpr double kDefaultTrackVolume = 0.8;
constexpr double kDefaultTrackPan = 0.5;
constexpr int kDefaultChordOctave = 4;

/// A single pitched note.
struct Note {
  uint8_t pitch = 60;        // MIDI pitch 0-127
  Beat start = 0.0;          // Relative to section start
  Beat duration = 1.0;       // > 0
  double velocity = kDefaultNoteVelocity;  // 0.0-1.0

  bool operator==(const Note& other) const {
    return pitch == other.pitch && start == other.start &&
           duration == other.duration && velocity == other.velocity;
  }
  bool operator!=(const Note& other) const { return !(*this == other); }
};

/// A chord kept in symbolic form; interval expansion happens at compile/export.
struct Chord {
  std::string root = "C";    // Upper-case letter + optional '#'/'b'
  std::string quality;       // Suffix, "" = major
  int octave = kDefaultChordOctave;
  Beat start = 0.0;
  Beat duration = 1.0;
  double velocity = kDefaultNoteVelocity;

  bool operator==(const Chord& other) const {
    return root == other.root && quality == other.quality && octave == other.octave &&
           start == other.start && duration == other.duration &&
           velocity == other.velocity;
  }
  bool operator!=(const Chord& other) const { return !(*this == other); }
};

/// One pitched instrument part within a section.
struct InstrumentTrack {
  std::string name;          // Display name ("Piano")
  std::string instrument;    // Lower-case program table key ("piano")
  std::vector<Note> notes;
  std::vector<Chord> chords;
  double volume = kDefaultTrackVolume;  // 0.0-1.0
  double pan = kDefaultTrackPan;        // 0.0 left, 0.5 center, 1.0 right

  bool operator==(const InstrumentTrack& other) const {
    return name == other.name && instrument == other.instrument &&
           notes == other.notes && chords == other.chords &&
           volume == other.volume && pan == other.pan;
  }
  bool operator!=(const InstrumentTrack& other) const { return !(*this == other); }
};

/// A single percussion hit (not sustained).
struct DrumHit {
  std::string drum;          // Lower-case drum table key ("kick")
  Beat start = 0.0;
  double velocity = kDefaultHitVelocity;

  bool operator==(const DrumHit& other) const {
    return drum == other.drum && start == other.start && velocity == other.velocity;
  }
  bool operator!=(const DrumHit& other) const { return !(*this == other); }
};

/// The percussion part of a section.
struct DrumTrack {
  std::string name = "Drums";
  std::vector<DrumHit> hits;
  double volume = kDefaultTrackVolume;

  bool operator==(const DrumTrack& other) const {
    return name == other.name && hits == other.hits && volume == other.volume;
  }
  bool operator!=(const DrumTrack& other) const { return !(*this == other); }
};

/// A named run of bars (intro, verse, chorus, ...).
struct Section {
  std::string name;
  int bars = kDefaultSectionBars;
  int start_bar = 0;                  // Assigned by the parser, never declared
  std::optional<std::string> key;     // Informational
  std::optional<int> tempo;           // Informational; timing uses the song tempo
  std::vector<InstrumentTrack> tracks;
  std::optional<DrumTrack> drums;

  /// @brief Length in beats (4 per bar).
  Beat durationBeats() const { return static_cast<Beat>(bars) * kBeatsPerBar; }

  /// @brief True when a drum track with at least one hit is present.
  bool hasDrumHits() const { return drums.has_value() && !drums->hits.empty(); }

  bool operator==(const Section& other) const {
    return name == other.name && bars == other.bars && start_bar == other.start_bar &&
           key == other.key && tempo == other.tempo && tracks == other.tracks &&
           drums == other.drums;
  }
  bool operator!=(const Section& other) const { return !(*this == other); }
};

/// A complete song.
struct Score {
  std::string title = "Untitled";
  int tempo = kDefaultTempo;          // BPM, > 0
  std::string key = "C";              // Informational
  std::string time_signature = "4/4"; // Informational
  std::vector<Section> sections;

  /// @brief Sum of all section bar counts.
  int totalBars() const;

  /// @brief totalBars() * 4.
  Beat totalBeats() const;

  /// @brief totalBeats() / tempo * 60 (0 when tempo is not positive).
  double durationSeconds() const;

  /// @brief True when any section carries a drum hit.
  bool hasDrumHits() const;

  /// @brief Recompute every start_bar as the running sum of preceding bars.
  void assignStartBars();

  bool operator==(const Score& other) const {
    return title == other.title && tempo == other.tempo && key == other.key &&
           time_signature == other.time_signature && sections == other.sections;
  }
  bool operator!=(const Score& other) const { return !(*this == other); }
};

/// @brief Seconds per beat at a tempo (60 / bpm).
inline double secondsPerBeat(int bpm) { return 60.0 / static_cast<double>(bpm); }

}  // namespace tunescript

#endif  // TUNESCRIPT_CORE_SCORE_H
