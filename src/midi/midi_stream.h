// Binary SMF helpers: variable-length quantities, big-endian integers,
// chunk and meta-event framing.

#ifndef REMI_MIDI_MIDI_STREAM_H
#define REMI_MIDI_MIDI_STREAM_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace remi {

/// Microseconds per minute, for tempo meta events.
constexpr uint32_t kMicrosecondsPerMinute = 60000000;

/// Meta event types used by the reader and writer.
namespace MetaType {
constexpr uint8_t kTrackName = 0x03;
constexpr uint8_t kEndOfTrack = 0x2F;
constexpr uint8_t kTempo = 0x51;
constexpr uint8_t kTimeSignature = 0x58;
}  // namespace MetaType

/// @brief Append a variable-length quantity (clamped to 0x0FFFFFFF).
void writeVariableLength(std::vector<uint8_t>& buf, uint32_t value);

/// @brief Read a variable-length quantity.
/// @param offset Read position; advanced past the quantity.
/// @param max_size Bound of readable bytes.
/// @return Decoded value (partial if the data ends early).
uint32_t readVariableLength(const uint8_t* data, size_t& offset, size_t max_size);

void writeBE16(std::vector<uint8_t>& buf, uint16_t value);
void writeBE24(std::vector<uint8_t>& buf, uint32_t value);
void writeBE32(std::vector<uint8_t>& buf, uint32_t value);

uint16_t readBE16(const uint8_t* data, size_t offset);
uint32_t readBE24(const uint8_t* data, size_t offset);
uint32_t readBE32(const uint8_t* data, size_t offset);

/// @brief Append a meta event: delta, FF, type, length, payload.
void writeMetaEvent(std::vector<uint8_t>& buf, uint32_t delta, uint8_t type,
                    const std::vector<uint8_t>& payload);

/// @brief Append a chunk: 4-byte id, big-endian length, payload.
void writeChunk(std::vector<uint8_t>& out, const char* id, const std::vector<uint8_t>& payload);

}  // namespace remi

#endif  // REMI_MIDI_MIDI_STREAM_H
