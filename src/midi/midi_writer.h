// MIDI writer: writes a Score as an SMF Type 1 file.

#ifndef REMI_MIDI_MIDI_WRITER_H
#define REMI_MIDI_MIDI_WRITER_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace remi {

/// @brief MIDI file writer producing Standard MIDI File (SMF) Type 1 output.
///
/// Track 0 is a conductor track holding every tempo and time signature
/// change. Each non-empty Track follows on its own channel; drum tracks use
/// channel 10. Melodic tracks take channels in order, skipping channel 10,
/// and share channels round-robin past fifteen.
class MidiWriter {
 public:
  MidiWriter();

  /// @brief Build complete MIDI data from a score at its time division.
  void build(const Score& score);

  /// @brief Get the binary MIDI data after build().
  std::vector<uint8_t> toBytes() const;

  /// @brief Write built MIDI data to a file.
  /// @return True if the file was written successfully.
  bool writeToFile(const std::string& path) const;

 private:
  std::vector<uint8_t> data_;

  /// Write the MThd (file header) chunk.
  void writeHeader(uint16_t num_tracks, uint16_t division);

  /// Write one track as an MTrk chunk with note events.
  void writeTrack(const Track& track, uint8_t channel);

  /// Write the conductor track (tempo and time signature maps).
  void writeConductorTrack(const std::vector<TempoChange>& tempo_changes,
                           const std::vector<TimeSignatureChange>& time_signatures);
};

}  // namespace remi

#endif  // REMI_MIDI_MIDI_WRITER_H
