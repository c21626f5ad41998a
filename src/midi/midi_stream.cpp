/// @file
/// @brief SMF byte helpers.

#include "midi/midi_stream.h"

namespace tunescript {

void writeVariableLength(std::vector<uint8_t>& buf, uint32_t value) {
  if (value > kMaxVariableLength) value = kMaxVariableLength;

  // 7 bits per byte, most significant group first, continuation bit on all
  // but the last byte.
  uint8_t groups[4];
  int count = 0;
  do {
    groups[count++] = static_cast<uint8_t>(value & 0x7F);
    value >>= 7;
  } while (value > 0);

  for (int idx = count - 1; idx >= 0; --idx) {
    buf.push_back(idx > 0 ? static_cast<uint8_t>(groups[idx] | 0x80) : groups[idx]);
  }
}

uint32_t readVariableLength(const uint8_t* data, size_t& offset, size_t max_size) {
  constexpr int kMaxBytes = 4;
  uint32_t result = 0;
  for (int count = 0; count < kMaxBytes && offset < max_size; ++count) {
    uint8_t byte = data[offset++];
    result = (result << 7) | static_cast<uint32_t>(byte & 0x7F);
    if ((byte & 0x80) == 0) break;
  }
  return result;
}

void writeBE16(std::vector<uint8_t>& buf, uint16_t value) {
  buf.push_back(static_cast<uint8_t>(value >> 8));
  buf.push_back(static_cast<uint8_t>(value & 0xFF));
}

void writeBE24(std::vector<uint8_t>& buf, uint32_t value) {
  buf.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  buf.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  buf.push_back(static_cast<uint8_t>(value & 0xFF));
}

void writeBE32(std::vector<uint8_t>& buf, uint32_t value) {
  buf.push_back(static_cast<uint8_t>(value >> 24));
  writeBE24(buf, value & 0x00FFFFFF);
}

uint16_t readBE16(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

uint32_t readBE24(const uint8_t* data, size_t offset) {
  return (static_cast<uint32_t>(data[offset]) << 16) |
         (static_cast<uint32_t>(data[offset + 1]) << 8) |
          static_cast<uint32_t>(data[offset + 2]);
}

uint32_t readBE32(const uint8_t* data, size_t offset) {
  return (static_cast<uint32_t>(data[offset]) << 24) | readBE24(data, offset + 1);
}

void writeMetaEvent(std::vector<uint8_t>& buf, uint32_t delta, uint8_t type,
                    const std::vector<uint8_t>& payload) {
  writeVariableLength(buf, delta);
  buf.push_back(0xFF);
  buf.push_back(type);
  writeVariableLength(buf, static_cast<uint32_t>(payload.size()));
  buf.insert(buf.end(), payload.begin(), payload.end());
}

void writeTextMeta(std::vector<uint8_t>& buf, uint32_t delta, uint8_t type, std::string_view text) {
  writeMetaEvent(buf, delta, type, std::vector<uint8_t>(text.begin(), text.end()));
}

void writeEndOfTrack(std::vector<uint8_t>& buf) {
  writeMetaEvent(buf, 0, kMetaEndOfTrack, {});
}

void appendChunk(std::vector<uint8_t>& out, const char (&id)[5], const std::vector<uint8_t>& body) {
  out.insert(out.end(), id, id + 4);
  writeBE32(out, static_cast<uint32_t>(body.size()));
  out.insert(out.end(), body.begin(), body.end());
}

}  // namespace tunescript
