/// @file
/// @brief Score JSON document writer and reader.

#include "core/score_json.h"

#include <cmath>
#include <fstream>
#include <sstream>

#include "core/json_helpers.h"
#include "core/json_parser.h"

namespace tunescript {

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

namespace {

void writeNote(JsonWriter& writer, const Note& note) {
  writer.beginObject();
  writer.key("pitch");
  writer.value(static_cast<int>(note.pitch));
  writer.key("start");
  writer.value(note.start);
  writer.key("duration");
  writer.value(note.duration);
  writer.key("velocity");
  writer.value(note.velocity);
  writer.endObject();
}

void writeChord(JsonWriter& writer, const Chord& chord) {
  writer.beginObject();
  writer.key("root");
  writer.value(chord.root);
  writer.key("quality");
  writer.value(chord.quality);
  writer.key("octave");
  writer.value(chord.octave);
  writer.key("start");
  writer.value(chord.start);
  writer.key("duration");
  writer.value(chord.duration);
  writer.key("velocity");
  writer.value(chord.velocity);
  writer.endObject();
}

void writeTrack(JsonWriter& writer, const InstrumentTrack& track) {
  writer.beginObject();
  writer.key("name");
  writer.value(track.name);
  writer.key("instrument");
  writer.value(track.instrument);

  writer.key("notes");
  writer.beginArray();
  for (const auto& note : track.notes) writeNote(writer, note);
  writer.endArray();

  writer.key("chords");
  writer.beginArray();
  for (const auto& chord : track.chords) writeChord(writer, chord);
  writer.endArray();

  writer.key("volume");
  writer.value(track.volume);
  writer.key("pan");
  writer.value(track.pan);
  writer.endObject();
}

void writeDrums(JsonWriter& writer, const DrumTrack& drums) {
  writer.beginObject();
  writer.key("name");
  writer.value(drums.name);
  writer.key("hits");
  writer.beginArray();
  for (const auto& hit : drums.hits) {
    writer.beginObject();
    writer.key("drum");
    writer.value(hit.drum);
    writer.key("start");
    writer.value(hit.start);
    writer.key("velocity");
    writer.value(hit.velocity);
    writer.endObject();
  }
  writer.endArray();
  writer.key("volume");
  writer.value(drums.volume);
  writer.endObject();
}

void writeSection(JsonWriter& writer, const Section& section) {
  writer.beginObject();
  writer.key("name");
  writer.value(section.name);
  writer.key("bars");
  writer.value(section.bars);
  writer.key("start_bar");
  writer.value(section.start_bar);

  writer.key("key");
  if (section.key) {
    writer.value(*section.key);
  } else {
    writer.valueNull();
  }

  writer.key("tempo");
  if (section.tempo) {
    writer.value(*section.tempo);
  } else {
    writer.valueNull();
  }

  writer.key("tracks");
  writer.beginArray();
  for (const auto& track : section.tracks) writeTrack(writer, track);
  writer.endArray();

  writer.key("drums");
  if (section.drums) {
    writeDrums(writer, *section.drums);
  } else {
    writer.valueNull();
  }
  writer.endObject();
}

}  // namespace

std::string scoreToJson(const Score& score, bool pretty) {
  JsonWriter writer(pretty ? 2 : 0);
  writer.beginObject();
  writer.key("title");
  writer.value(score.title);
  writer.key("tempo");
  writer.value(score.tempo);
  writer.key("key");
  writer.value(score.key);
  writer.key("time_signature");
  writer.value(score.time_signature);
  writer.key("sections");
  writer.beginArray();
  for (const auto& section : score.sections) writeSection(writer, section);
  writer.endArray();
  writer.endObject();
  return writer.toString();
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

namespace {

// Loaded scores go straight to the compiler and exporter, so the document
// must stay inside the ranges the parser can produce.
constexpr int kMinOctave = -1;
constexpr int kMaxOctave = 9;
constexpr int kMaxSectionBars = 999999;
constexpr int kMaxTotalBars = 100000000;

/// @brief Field accessors that record the first error with its document path.
class DocumentReader {
 public:
  const std::string& error() const { return error_; }

  bool fail(const std::string& path, const std::string& message) {
    if (error_.empty()) error_ = path + ": " + message;
    return false;
  }

  bool requireObject(const JsonValue& value, const std::string& path) {
    if (value.isObject()) return true;
    return fail(path, "expected an object");
  }

  bool requireString(const JsonValue& obj, const char* key, const std::string& path,
                     std::string& out) {
    const JsonValue* field = obj.find(key);
    if (!field) return fail(path, std::string("missing \"") + key + "\"");
    if (!field->isString()) return fail(path + "." + key, "expected a string");
    out = field->string_val;
    return true;
  }

  bool optionalString(const JsonValue& obj, const char* key, const std::string& path,
                      std::string& out) {
    const JsonValue* field = obj.find(key);
    if (!field || field->isNull()) return true;
    if (!field->isString()) return fail(path + "." + key, "expected a string");
    out = field->string_val;
    return true;
  }

  bool requireNumber(const JsonValue& obj, const char* key, const std::string& path,
                     double& out) {
    const JsonValue* field = obj.find(key);
    if (!field) return fail(path, std::string("missing \"") + key + "\"");
    if (!field->isNumber()) return fail(path + "." + key, "expected a number");
    if (!std::isfinite(field->number_val)) return fail(path + "." + key, "not a finite number");
    out = field->number_val;
    return true;
  }

  bool optionalNumber(const JsonValue& obj, const char* key, const std::string& path,
                      double& out) {
    const JsonValue* field = obj.find(key);
    if (!field || field->isNull()) return true;
    if (!field->isNumber()) return fail(path + "." + key, "expected a number");
    if (!std::isfinite(field->number_val)) return fail(path + "." + key, "not a finite number");
    out = field->number_val;
    return true;
  }

  /// @brief Optional 0.0-1.0 level (velocity, volume, pan).
  bool optionalLevel(const JsonValue& obj, const char* key, const std::string& path,
                     double& out) {
    if (!optionalNumber(obj, key, path, out)) return false;
    if (out < 0.0 || out > 1.0) return fail(path + "." + key, "out of range 0-1");
    return true;
  }

  /// @brief Required start (>= 0) and duration (> 0) in beats.
  bool requireSpan(const JsonValue& obj, const std::string& path, Beat& start, Beat& duration) {
    if (!requireNumber(obj, "start", path, start)) return false;
    if (start < 0.0) return fail(path + ".start", "must not be negative");
    if (!requireNumber(obj, "duration", path, duration)) return false;
    if (duration <= 0.0) return fail(path + ".duration", "must be positive");
    return true;
  }

  bool requireInt(const JsonValue& obj, const char* key, const std::string& path, int& out) {
    double number = 0.0;
    if (!requireNumber(obj, key, path, number)) return false;
    return toInt(number, path + "." + key, out);
  }

  bool optionalInt(const JsonValue& obj, const char* key, const std::string& path, int& out) {
    const JsonValue* field = obj.find(key);
    if (!field || field->isNull()) return true;
    if (!field->isNumber()) return fail(path + "." + key, "expected a number");
    return toInt(field->number_val, path + "." + key, out);
  }

  /// @return Pointer to the array, nullptr when absent/null (and no error),
  ///         or nullptr with an error recorded when the type is wrong.
  const JsonValue* optionalArray(const JsonValue& obj, const char* key,
                                 const std::string& path) {
    const JsonValue* field = obj.find(key);
    if (!field || field->isNull()) return nullptr;
    if (!field->isArray()) {
      fail(path + "." + key, "expected an array");
      return nullptr;
    }
    return field;
  }

 private:
  std::string error_;

  bool toInt(double number, const std::string& path, int& out) {
    if (std::floor(number) != number || number < -2147483648.0 || number > 2147483647.0) {
      return fail(path, "expected an integer");
    }
    out = static_cast<int>(number);
    return true;
  }
};

std::string indexPath(const std::string& base, const char* key, size_t idx) {
  return base + "." + key + "[" + std::to_string(idx) + "]";
}

bool readNote(DocumentReader& reader, const JsonValue& obj, const std::string& path, Note& note) {
  if (!reader.requireObject(obj, path)) return false;
  int pitch = 0;
  if (!reader.requireInt(obj, "pitch", path, pitch)) return false;
  if (pitch < 0 || pitch > 127) return reader.fail(path + ".pitch", "out of range 0-127");
  note.pitch = static_cast<uint8_t>(pitch);
  if (!reader.requireSpan(obj, path, note.start, note.duration)) return false;
  return reader.optionalLevel(obj, "velocity", path, note.velocity);
}

bool readChord(DocumentReader& reader, const JsonValue& obj, const std::string& path,
               Chord& chord) {
  if (!reader.requireObject(obj, path)) return false;
  if (!reader.requireString(obj, "root", path, chord.root)) return false;
  if (!reader.requireString(obj, "quality", path, chord.quality)) return false;
  if (!reader.requireInt(obj, "octave", path, chord.octave)) return false;
  if (chord.octave < kMinOctave || chord.octave > kMaxOctave) {
    return reader.fail(path + ".octave", "out of range -1-9");
  }
  if (!reader.requireSpan(obj, path, chord.start, chord.duration)) return false;
  return reader.optionalLevel(obj, "velocity", path, chord.velocity);
}

bool readTrack(DocumentReader& reader, const JsonValue& obj, const std::string& path,
               InstrumentTrack& track) {
  if (!reader.requireObject(obj, path)) return false;
  if (!reader.requireString(obj, "name", path, track.name)) return false;
  if (!reader.requireString(obj, "instrument", path, track.instrument)) return false;
  if (!reader.optionalLevel(obj, "volume", path, track.volume)) return false;
  if (!reader.optionalLevel(obj, "pan", path, track.pan)) return false;

  if (const JsonValue* notes = reader.optionalArray(obj, "notes", path)) {
    for (size_t idx = 0; idx < notes->array_items.size(); ++idx) {
      Note note;
      if (!readNote(reader, notes->array_items[idx], indexPath(path, "notes", idx), note)) {
        return false;
      }
      track.notes.push_back(note);
    }
  }
  if (!reader.error().empty()) return false;

  if (const JsonValue* chords = reader.optionalArray(obj, "chords", path)) {
    for (size_t idx = 0; idx < chords->array_items.size(); ++idx) {
      Chord chord;
      if (!readChord(reader, chords->array_items[idx], indexPath(path, "chords", idx), chord)) {
        return false;
      }
      track.chords.push_back(std::move(chord));
    }
  }
  return reader.error().empty();
}

bool readDrums(DocumentReader& reader, const JsonValue& obj, const std::string& path,
               DrumTrack& drums) {
  if (!reader.requireObject(obj, path)) return false;
  if (!reader.optionalString(obj, "name", path, drums.name)) return false;
  if (!reader.optionalLevel(obj, "volume", path, drums.volume)) return false;

  if (const JsonValue* hits = reader.optionalArray(obj, "hits", path)) {
    for (size_t idx = 0; idx < hits->array_items.size(); ++idx) {
      const JsonValue& item = hits->array_items[idx];
      std::string item_path = indexPath(path, "hits", idx);
      DrumHit hit;
      if (!reader.requireObject(item, item_path)) return false;
      if (!reader.requireString(item, "drum", item_path, hit.drum)) return false;
      if (!reader.requireNumber(item, "start", item_path, hit.start)) return false;
      if (hit.start < 0.0) return reader.fail(item_path + ".start", "must not be negative");
      if (!reader.optionalLevel(item, "velocity", item_path, hit.velocity)) return false;
      drums.hits.push_back(std::move(hit));
    }
  }
  return reader.error().empty();
}

bool readSection(DocumentReader& reader, const JsonValue& obj, const std::string& path,
                 Section& section) {
  if (!reader.requireObject(obj, path)) return false;
  if (!reader.requireString(obj, "name", path, section.name)) return false;
  if (!reader.requireInt(obj, "bars", path, section.bars)) return false;
  if (section.bars <= 0) return reader.fail(path + ".bars", "must be positive");
  if (section.bars > kMaxSectionBars) return reader.fail(path + ".bars", "too large");
  if (!reader.optionalInt(obj, "start_bar", path, section.start_bar)) return false;
  if (section.start_bar < 0 || section.start_bar > kMaxTotalBars) {
    return reader.fail(path + ".start_bar", "out of range");
  }

  const JsonValue* key = obj.find("key");
  if (key && !key->isNull()) {
    if (!key->isString()) return reader.fail(path + ".key", "expected a string");
    section.key = key->string_val;
  }

  const JsonValue* tempo = obj.find("tempo");
  if (tempo && !tempo->isNull()) {
    int tempo_val = 0;
    if (!reader.optionalInt(obj, "tempo", path, tempo_val)) return false;
    section.tempo = tempo_val;
  }

  if (const JsonValue* tracks = reader.optionalArray(obj, "tracks", path)) {
    for (size_t idx = 0; idx < tracks->array_items.size(); ++idx) {
      InstrumentTrack track;
      if (!readTrack(reader, tracks->array_items[idx], indexPath(path, "tracks", idx), track)) {
        return false;
      }
      section.tracks.push_back(std::move(track));
    }
  }
  if (!reader.error().empty()) return false;

  const JsonValue* drums = obj.find("drums");
  if (drums && !drums->isNull()) {
    DrumTrack drum_track;
    if (!readDrums(reader, *drums, path + ".drums", drum_track)) return false;
    section.drums = std::move(drum_track);
  }
  return true;
}

}  // namespace

ScoreLoadResult scoreFromJson(std::string_view json) {
  ScoreLoadResult result;

  JsonParseResult parsed = parseJson(json);
  if (!parsed.success) {
    result.error_message = "Invalid JSON at offset " + std::to_string(parsed.error_offset) +
                           ": " + parsed.error_message;
    return result;
  }

  DocumentReader reader;
  const JsonValue& root = parsed.value;
  Score score;
  bool ok = reader.requireObject(root, "score") &&
            reader.optionalString(root, "title", "score", score.title) &&
            reader.optionalInt(root, "tempo", "score", score.tempo) &&
            reader.optionalString(root, "key", "score", score.key) &&
            reader.optionalString(root, "time_signature", "score", score.time_signature);
  if (ok && score.tempo <= 0) {
    ok = reader.fail("score.tempo", "must be positive");
  }

  if (ok) {
    if (const JsonValue* sections = reader.optionalArray(root, "sections", "score")) {
      int total_bars = 0;
      for (size_t idx = 0; idx < sections->array_items.size() && ok; ++idx) {
        Section section;
        std::string path = indexPath("score", "sections", idx);
        ok = readSection(reader, sections->array_items[idx], path, section);
        if (ok && section.bars > kMaxTotalBars - total_bars) {
          ok = reader.fail(path + ".bars", "song too long");
        }
        if (ok) {
          total_bars += section.bars;
          score.sections.push_back(std::move(section));
        }
      }
    }
    ok = ok && reader.error().empty();
  }

  if (!ok) {
    result.error_message = reader.error();
    return result;
  }

  result.score = std::move(score);
  result.success = true;
  return result;
}

bool saveScoreFile(const Score& score, const std::string& path) {
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open()) return false;
  file << scoreToJson(score) << '\n';
  file.close();
  return !file.fail();
}

ScoreLoadResult loadScoreFile(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    ScoreLoadResult result;
    result.error_message = "Failed to open file: " + path;
    return result;
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  return scoreFromJson(contents.str());
}

}  // namespace tunescript
