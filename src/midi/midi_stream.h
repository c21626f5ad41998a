// Byte-level building blocks of Standard MIDI Files: variable-length
// quantities, big-endian integers, meta events and chunks.

#ifndef TUNESCRIPT_MIDI_MIDI_STREAM_H
#define TUNESCRIPT_MIDI_MIDI_STREAM_H

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace tunescript {

/// Microseconds per minute, for tempo meta events.
constexpr uint32_t kMicrosecondsPerMinute = 60000000;

/// Largest value a variable-length quantity can hold.
constexpr uint32_t kMaxVariableLength = 0x0FFFFFFF;

/// Meta event types used by the exporter and reader.
constexpr uint8_t kMetaText = 0x01;
constexpr uint8_t kMetaTrackName = 0x03;
constexpr uint8_t kMetaEndOfTrack = 0x2F;
constexpr uint8_t kMetaTempo = 0x51;
constexpr uint8_t kMetaTimeSignature = 0x58;

/// @brief Append a variable-length quantity (values above 0x0FFFFFFF are clamped).
void writeVariableLength(std::vector<uint8_t>& buf, uint32_t value);

/// @brief Decode a variable-length quantity.
/// @param data Raw bytes.
/// @param offset Read position, advanced past the quantity.
/// @param max_size Bound of readable bytes.
/// @return Decoded value (partial if the data ends early).
uint32_t readVariableLength(const uint8_t* data, size_t& offset, size_t max_size);

void writeBE16(std::vector<uint8_t>& buf, uint16_t value);
void writeBE24(std::vector<uint8_t>& buf, uint32_t value);
void writeBE32(std::vector<uint8_t>& buf, uint32_t value);

uint16_t readBE16(const uint8_t* data, size_t offset);
uint32_t readBE24(const uint8_t* data, size_t offset);
uint32_t readBE32(const uint8_t* data, size_t offset);

/// @brief Append a meta event: delta, 0xFF, type, length, payload.
void writeMetaEvent(std::vector<uint8_t>& buf, uint32_t delta, uint8_t type,
                    const std::vector<uint8_t>& payload);

/// @brief Append a text-like meta event (track name, text) from a string.
void writeTextMeta(std::vector<uint8_t>& buf, uint32_t delta, uint8_t type, std::string_view text);

/// @brief Append the end-of-track meta event at delta 0.
void writeEndOfTrack(std::vector<uint8_t>& buf);

/// @brief Append a chunk: 4-byte id, big-endian length, body.
void appendChunk(std::vector<uint8_t>& out, const char (&id)[5], const std::vector<uint8_t>& body);

}  // namespace tunescript

#endif  // TUNESCRIPT_MIDI_MIDI_STREAM_H
