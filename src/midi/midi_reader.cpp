/// @file
/// @brief SMF reader for checking exported files.

#include "midi/midi_reader.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>

#include "midi/midi_stream.h"

namespace tunescript {

namespace {

constexpr size_t kHeaderSize = 14;
constexpr size_t kChunkPrefixSize = 8;

/// @brief Walks the events of one MTrk body and fills an SmfTrack.
class TrackScanner {
 public:
  TrackScanner(const uint8_t* data, size_t begin, size_t end, SmfFile& file)
      : data_(data), pos_(begin), end_(end), file_(file) {}

  /// @return False only for a data byte with no status to run from.
  bool scan(SmfTrack& track) {
    uint8_t status = 0;
    bool channel_seen = false;
    while (pos_ < end_) {
      tick_ += readVariableLength(data_, pos_, end_);
      if (pos_ >= end_) break;

      if (data_[pos_] == 0xFF) {
        if (!readMeta(track)) break;
        continue;
      }
      if (data_[pos_] & 0x80) status = data_[pos_++];
      if (status == 0) return false;

      // Program change and channel pressure carry a single data byte.
      const size_t data_len = (status & 0xE0) == 0xC0 ? 1 : 2;
      if (pos_ + data_len > end_) break;
      const uint8_t channel = status & 0x0F;
      if (!channel_seen) {
        track.channel = channel;
        channel_seen = true;
      }
      const uint8_t data1 = data_[pos_] & 0x7F;
      const uint8_t data2 = data_len == 2 ? (data_[pos_ + 1] & 0x7F) : 0;
      pos_ += data_len;
      onChannelMessage(track, status & 0xF0, channel, data1, data2);
    }

    std::stable_sort(track.notes.begin(), track.notes.end(),
                     [](const SmfNote& lhs, const SmfNote& rhs) {
                       return lhs.start_tick < rhs.start_tick;
                     });
    return true;
  }

 private:
  /// @return False at End of Track or when the event is cut short.
  bool readMeta(SmfTrack& track) {
    if (pos_ + 2 > end_) return false;
    const uint8_t type = data_[pos_ + 1];
    pos_ += 2;
    const uint32_t len = readVariableLength(data_, pos_, end_);
    if (pos_ + len > end_) return false;
    const uint8_t* payload = data_ + pos_;
    pos_ += len;

    switch (type) {
      case kMetaTrackName:
        track.name.assign(reinterpret_cast<const char*>(payload), len);
        break;
      case kMetaTempo:
        if (len == 3 && !file_.has_tempo) {
          file_.tempo_usec = readBE24(payload, 0);
          file_.has_tempo = true;
        }
        break;
      case kMetaTimeSignature:
        if (len >= 2) {
          file_.time_sig_numerator = payload[0];
          file_.time_sig_denominator_pow2 = payload[1];
        }
        break;
      default:
        break;
    }
    return type != kMetaEndOfTrack;
  }

  void onChannelMessage(SmfTrack& track, uint8_t kind, uint8_t channel, uint8_t data1,
                        uint8_t data2) {
    const int key = channel * 128 + data1;
    if (kind == 0x90 && data2 > 0) {
      SmfNote note;
      note.start_tick = tick_;
      note.channel = channel;
      note.pitch = data1;
      note.velocity = data2;
      open_notes_[key] = note;
    } else if (kind == 0x80 || kind == 0x90) {
      auto iter = open_notes_.find(key);
      if (iter == open_notes_.end()) return;
      SmfNote note = iter->second;
      note.duration = tick_ - note.start_tick;
      track.notes.push_back(note);
      open_notes_.erase(iter);
    } else if (kind == 0xC0) {
      track.has_program = true;
      track.program = data1;
    } else if (kind == 0xB0) {
      track.controls.emplace(data1, data2);
    }
  }

  const uint8_t* data_;
  size_t pos_;
  size_t end_;
  SmfFile& file_;
  uint32_t tick_ = 0;
  std::map<int, SmfNote> open_notes_;  // channel * 128 + pitch
};

}  // namespace

int SmfFile::bpm() const {
  if (tempo_usec == 0) return 0;
  return static_cast<int>(std::lround(static_cast<double>(kMicrosecondsPerMinute) / tempo_usec));
}

const SmfTrack* SmfFile::getTrack(const std::string& name) const {
  auto iter = std::find_if(tracks.begin(), tracks.end(),
                           [&name](const SmfTrack& track) { return track.name == name; });
  return iter == tracks.end() ? nullptr : &*iter;
}

bool MidiReader::read(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    error_ = "Failed to open file: " + path;
    return false;
  }
  std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
  return read(data);
}

bool MidiReader::read(const std::vector<uint8_t>& data) {
  file_ = SmfFile{};
  error_.clear();

  if (data.size() < kHeaderSize || std::memcmp(data.data(), "MThd", 4) != 0) {
    error_ = "Invalid MIDI file: missing MThd header";
    return false;
  }
  const uint32_t header_len = readBE32(data.data(), 4);
  if (header_len < 6 || kChunkPrefixSize + header_len > data.size()) {
    error_ = "Invalid MIDI header length";
    return false;
  }
  file_.format = readBE16(data.data(), 8);
  file_.num_tracks = readBE16(data.data(), 10);
  file_.division = readBE16(data.data(), 12);
  if (file_.format > 1) {
    error_ = "Unsupported MIDI format: " + std::to_string(file_.format);
    return false;
  }

  size_t chunk = kChunkPrefixSize + header_len;
  for (uint16_t idx = 0; idx < file_.num_tracks; ++idx) {
    if (chunk + kChunkPrefixSize > data.size() ||
        std::memcmp(data.data() + chunk, "MTrk", 4) != 0) {
      error_ = "Missing MTrk chunk for track " + std::to_string(idx);
      return false;
    }
    const size_t body = chunk + kChunkPrefixSize;
    const size_t end = body + readBE32(data.data(), chunk + 4);
    if (end > data.size()) {
      error_ = "Track chunk exceeds file size";
      return false;
    }

    SmfTrack track;
    TrackScanner scanner(data.data(), body, end, file_);
    if (!scanner.scan(track)) {
      error_ = "Data byte without status in track " + std::to_string(idx);
      return false;
    }
    file_.tracks.push_back(std::move(track));
    chunk = end;
  }
  return true;
}

}  // namespace tunescript
