// Built-in DSL lookup tables and lookup helpers.

#include "core/music_tables.h"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "core/string_utils.h"

namespace tunescript {

namespace {

/// @brief General MIDI program numbers (0-indexed) by instrument name.
/// Names cover the GM family names plus common track labels ("keys", "gtr").
void addInstrumentPrograms(std::map<std::string, int>& programs) {
  // Piano
  programs["piano"] = 0;
  programs["bright_piano"] = 1;
  programs["honkytonk"] = 3;
  programs["electric_piano"] = 4;
  programs["keys"] = 0;
  programs["keyboard"] = 0;

  // Chromatic percussion
  programs["celesta"] = 8;
  programs["glockenspiel"] = 9;
  programs["music_box"] = 10;
  programs["vibraphone"] = 11;
  programs["marimba"] = 12;
  programs["xylophone"] = 13;

  // Organ
  programs["rock_organ"] = 18;
  programs["organ"] = 19;
  programs["church_organ"] = 19;

  // Guitar
  programs["acoustic_guitar"] = 24;
  programs["guitar"] = 25;  // Steel string
  programs["gtr"] = 25;
  programs["electric_guitar"] = 27;
  programs["clean_guitar"] = 27;
  programs["distortion_guitar"] = 30;

  // Bass
  programs["acoustic_bass"] = 32;
  programs["bass"] = 33;
  programs["electric_bass"] = 33;
  programs["slap_bass"] = 36;
  programs["synth_bass"] = 38;

  // Strings
  programs["violin"] = 40;
  programs["viola"] = 41;
  programs["cello"] = 42;
  programs["contrabass"] = 43;
  programs["tremolo_strings"] = 44;
  programs["pizzicato"] = 45;
  programs["harp"] = 46;
  programs["strings"] = 48;

  // Ensemble
  programs["string_ensemble"] = 48;
  programs["synth_strings"] = 50;
  programs["choir"] = 52;
  programs["voice"] = 54;
  programs["vox"] = 54;
  programs["vocals"] = 54;

  // Brass
  programs["trumpet"] = 56;
  programs["trombone"] = 57;
  programs["tuba"] = 58;
  programs["french_horn"] = 60;
  programs["brass"] = 61;
  programs["horns"] = 61;
  programs["synth_brass"] = 62;

  // Reed
  programs["saxophone"] = 65;
  programs["alto_sax"] = 65;
  programs["tenor_sax"] = 66;
  programs["oboe"] = 68;
  programs["clarinet"] = 71;

  // Pipe
  programs["flute"] = 73;
  programs["woodwinds"] = 73;
  programs["recorder"] = 74;
  programs["pan_flute"] = 75;

  // Synth lead
  programs["lead"] = 80;
  programs["square_lead"] = 80;
  programs["saw_lead"] = 81;
  programs["synth_lead"] = 81;
  programs["synth"] = 81;
  programs["synths"] = 81;

  // Synth pad
  programs["pad"] = 88;
  programs["pads"] = 88;
  programs["new_age_pad"] = 88;
  programs["ambient"] = 88;
  programs["warm_pad"] = 89;
  programs["polysynth"] = 90;
  programs["space_pad"] = 91;

  // Effects
  programs["fx"] = 96;
  programs["rain"] = 96;
  programs["soundtrack"] = 97;
  programs["crystal"] = 98;
  programs["atmosphere"] = 99;

  // Percussion kit (channel 10)
  programs["drums"] = kPercussionProgram;
  programs["drum"] = kPercussionProgram;
  programs["percussion"] = kPercussionProgram;
  programs["perc"] = kPercussionProgram;
  programs["kit"] = kPercussionProgram;
}

/// @brief GM percussion key map (channel 10 note numbers).
void addDrumPitches(std::map<std::string, uint8_t>& drums) {
  drums["kick"] = 36;
  drums["bass"] = 36;
  drums["bd"] = 36;
  drums["rimshot"] = 37;
  drums["snare"] = 38;
  drums["sd"] = 38;
  drums["clap"] = 39;
  drums["hat"] = 42;
  drums["hh"] = 42;
  drums["closed_hat"] = 42;
  drums["tom_low"] = 45;
  drums["open_hat"] = 46;
  drums["oh"] = 46;
  drums["tom_mid"] = 47;
  drums["crash"] = 49;
  drums["tom_high"] = 50;
  drums["ride"] = 51;
  drums["china"] = 52;
  drums["bell"] = 53;
  drums["tambourine"] = 54;
  drums["cowbell"] = 56;
}

}  // namespace

MusicTables MusicTables::makeDefault() {
  MusicTables tables;

  tables.note_semitones = {{'C', 0}, {'D', 2}, {'E', 4}, {'F', 5},
                           {'G', 7}, {'A', 9}, {'B', 11}};

  tables.chord_intervals = {
      {"", {0, 4, 7}},           // Major
      {"m", {0, 3, 7}},          // Minor
      {"7", {0, 4, 7, 10}},      // Dominant 7
      {"maj7", {0, 4, 7, 11}},   // Major 7
      {"m7", {0, 3, 7, 10}},     // Minor 7
      {"dim", {0, 3, 6}},        // Diminished
      {"dim7", {0, 3, 6, 9}},    // Diminished 7
      {"aug", {0, 4, 8}},        // Augmented
      {"sus2", {0, 2, 7}},
      {"sus4", {0, 5, 7}},
      {"add9", {0, 4, 7, 14}},
      {"9", {0, 4, 7, 10, 14}},  // Dominant 9
  };

  // w=whole, h=half, q=quarter, e=eighth, s=sixteenth, d=dotted, t=triplet eighth
  tables.durations = {{"w", 4.0},  {"h", 2.0},  {"dh", 3.0},
                      {"q", 1.0},  {"dq", 1.5}, {"e", 0.5},
                      {"de", 0.75}, {"s", 0.25}, {"t", 0.333}};

  tables.dynamics = {{"ppp", 0.15}, {"pp", 0.25}, {"p", 0.4},  {"mp", 0.55},
                     {"mf", 0.7},   {"f", 0.85},  {"ff", 0.95}, {"fff", 1.0}};

  addInstrumentPrograms(tables.instrument_programs);
  addDrumPitches(tables.drum_pitches);
  return tables;
}

const MusicTables& MusicTables::defaults() {
  static const MusicTables kDefaults = makeDefault();
  return kDefaults;
}

std::optional<int> MusicTables::noteSemitone(std::string_view name) const {
  if (name.empty() || name.size() > 2) return std::nullopt;

  char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
  auto iter = note_semitones.find(letter);
  if (iter == note_semitones.end()) return std::nullopt;

  int semitone = iter->second;
  if (name.size() == 2) {
    if (name[1] == '#') {
      ++semitone;
    } else if (name[1] == 'b') {
      --semitone;
    } else {
      return std::nullopt;
    }
  }
  return semitone;
}

bool MusicTables::isKnownQuality(std::string_view quality) const {
  return chord_intervals.count(toLower(quality)) > 0;
}

std::vector<int> MusicTables::chordIntervals(std::string_view quality) const {
  const std::string lower = toLower(quality);
  auto exact = chord_intervals.find(lower);
  if (exact != chord_intervals.end()) return exact->second;

  auto contains = [&lower](const char* part) {
    return lower.find(part) != std::string::npos;
  };

  // Map loose spellings ("maj9", "min", "7sus4") onto the nearest table entry.
  const char* fallback = "";
  if (contains("maj7")) {
    fallback = "maj7";
  } else if (contains("maj")) {
    fallback = "";
  } else if (contains("m7") || contains("min7")) {
    fallback = "m7";
  } else if (startsWith(lower, "m") || contains("min")) {
    fallback = "m";
  } else if (contains("sus4")) {
    fallback = "sus4";
  } else if (contains("sus2")) {
    fallback = "sus2";
  } else if (contains("dim7")) {
    fallback = "dim7";
  } else if (contains("dim")) {
    fallback = "dim";
  } else if (contains("aug")) {
    fallback = "aug";
  } else if (contains("7")) {
    fallback = "7";
  }

  auto resolved = chord_intervals.find(fallback);
  if (resolved != chord_intervals.end()) return resolved->second;
  return {0, 4, 7};
}

std::optional<double> MusicTables::durationBeats(std::string_view code) const {
  auto iter = durations.find(std::string(code));
  if (iter == durations.end()) return std::nullopt;
  return iter->second;
}

std::optional<double> MusicTables::dynamicsVelocity(std::string_view code) const {
  auto iter = dynamics.find(std::string(code));
  if (iter == dynamics.end()) return std::nullopt;
  return iter->second;
}

bool MusicTables::isKnownInstrument(std::string_view instrument) const {
  return instrument_programs.count(toLower(instrument)) > 0;
}

bool MusicTables::isPercussionInstrument(std::string_view instrument) const {
  auto iter = instrument_programs.find(toLower(instrument));
  return iter != instrument_programs.end() && iter->second == kPercussionProgram;
}

uint8_t MusicTables::instrumentProgram(std::string_view instrument) const {
  auto iter = instrument_programs.find(toLower(instrument));
  if (iter == instrument_programs.end() || iter->second < 0 || iter->second > 127) {
    return kDefaultProgram;
  }
  return static_cast<uint8_t>(iter->second);
}

uint8_t MusicTables::drumPitch(std::string_view drum) const {
  auto iter = drum_pitches.find(toLower(drum));
  if (iter == drum_pitches.end()) return kDefaultDrumPitch;
  return iter->second;
}

namespace {

// Octaves beyond these already clamp to 0 or 127; bounding them keeps the
// arithmetic in range for any int.
constexpr int kLowestOctave = -3;
constexpr int kHighestOctave = 11;

int octaveBase(int octave) {
  return (std::clamp(octave, kLowestOctave, kHighestOctave) + 1) * 12;
}

}  // namespace

std::optional<int> rawNotePitch(const MusicTables& tables, std::string_view name, int octave) {
  auto semitone = tables.noteSemitone(name);
  if (!semitone) return std::nullopt;
  return *semitone + octaveBase(octave);
}

std::optional<uint8_t> notePitch(const MusicTables& tables, std::string_view name, int octave) {
  auto raw = rawNotePitch(tables, name, octave);
  if (!raw) return std::nullopt;
  return clampMidi(*raw);
}

std::vector<uint8_t> chordPitches(const MusicTables& tables, std::string_view root,
                                  std::string_view quality, int octave) {
  int base = rawNotePitch(tables, root, octave).value_or(octaveBase(octave));
  std::vector<uint8_t> pitches;
  for (int interval : tables.chordIntervals(quality)) {
    pitches.push_back(clampMidi(base + interval));
  }
  return pitches;
}

uint8_t clampMidi(int value) {
  if (value < 0) return 0;
  if (value > 127) return 127;
  return static_cast<uint8_t>(value);
}

uint8_t velocityToMidi(double velocity, uint8_t min_value) {
  double scaled = velocity * 127.0;
  // NaN fails both comparisons and lands on min_value.
  if (!(scaled >= min_value)) return min_value;
  if (scaled >= 127.0) return 127;
  return static_cast<uint8_t>(scaled);
}

uint8_t panToMidi(double pan) {
  if (!(pan > 0.0)) return 0;
  if (pan >= 1.0) return 127;
  return static_cast<uint8_t>(std::lround(pan * 127.0));
}

}  // namespace tunescript
