/// @file
/// @brief Binary SMF helper implementations.

#include "midi/midi_stream.h"

namespace remi {

void writeVariableLength(std::vector<uint8_t>& buf, uint32_t value) {
  if (value > 0x0FFFFFFF) value = 0x0FFFFFFF;

  // 7 bits per byte, least significant group first, then reversed.
  uint8_t encoded[4];
  int num_bytes = 0;
  encoded[num_bytes++] = static_cast<uint8_t>(value & 0x7F);
  value >>= 7;
  while (value > 0) {
    encoded[num_bytes++] = static_cast<uint8_t>((value & 0x7F) | 0x80);
    value >>= 7;
  }
  for (int idx = num_bytes - 1; idx >= 0; --idx) {
    buf.push_back(encoded[idx]);
  }
}

uint32_t readVariableLength(const uint8_t* data, size_t& offset, size_t max_size) {
  constexpr int kMaxVlqBytes = 4;
  uint32_t result = 0;
  for (int count = 0; count < kMaxVlqBytes && offset < max_size; ++count) {
    uint8_t byte = data[offset++];
    result = (result << 7) | static_cast<uint32_t>(byte & 0x7F);
    if ((byte & 0x80) == 0) break;
  }
  return result;
}

void writeBE16(std::vector<uint8_t>& buf, uint16_t value) {
  buf.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  buf.push_back(static_cast<uint8_t>(value & 0xFF));
}

void writeBE24(std::vector<uint8_t>& buf, uint32_t value) {
  buf.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  buf.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  buf.push_back(static_cast<uint8_t>(value & 0xFF));
}

void writeBE32(std::vector<uint8_t>& buf, uint32_t value) {
  buf.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
  writeBE24(buf, value & 0xFFFFFF);
}

uint16_t readBE16(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>((static_cast<uint16_t>(data[offset]) << 8) |
                               static_cast<uint16_t>(data[offset + 1]));
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

void writeChunk(std::vector<uint8_t>& out, const char* id, const std::vector<uint8_t>& payload) {
  for (int idx = 0; idx < 4; ++idx) out.push_back(static_cast<uint8_t>(id[idx]));
  writeBE32(out, static_cast<uint32_t>(payload.size()));
  out.insert(out.end(), payload.begin(), payload.end());
}

}  // namespace remi
