// MIDI reader: parses SMF Type 0/1 files into a Score.

#ifndef REMI_MIDI_MIDI_READER_H
#define REMI_MIDI_MIDI_READER_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace remi {

/// @brief MIDI file reader producing a Score.
///
/// Handles note on/off pairing per channel, running status, program
/// changes, the tempo map (FF 51) and the time signature map (FF 58).
/// Notes on channel 10 go to the drum bucket. Each track chunk yields one
/// Track per program it plays.
class MidiReader {
 public:
  MidiReader() = default;

  /// @brief Read and parse a MIDI file from disk.
  /// @return True on success. On failure, call getError() for details.
  bool read(const std::string& path);

  /// @brief Read and parse MIDI data from a byte buffer.
  /// @return True on success. On failure, call getError() for details.
  bool read(const std::vector<uint8_t>& data);

  /// @brief Parsed score (valid after a successful read).
  const Score& getScore() const { return score_; }

  /// @brief SMF format of the last file read (0, 1 or 2).
  uint16_t getFormat() const { return format_; }

  const std::string& getError() const { return error_; }

 private:
  Score score_;
  uint16_t format_ = 0;
  uint16_t num_tracks_ = 0;
  std::string error_;

  /// Parse the MThd header chunk.
  bool parseHeader(const uint8_t* data, size_t size);

  /// Parse a single MTrk chunk starting at offset.
  bool parseTrack(const uint8_t* data, size_t size, size_t& offset);
};

}  // namespace remi

#endif  // REMI_MIDI_MIDI_READER_H
