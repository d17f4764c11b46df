/// @file
/// @brief SMF Type 0/1 MIDI file reader implementation.

#include "midi/midi_reader.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <deque>
#include <map>
#include <utility>

#include "core/gm_program.h"
#include "midi/midi_stream.h"

namespace remi {

namespace {

constexpr int kNumChannels = 16;
constexpr int kNumPitches = 128;

/// Unmatched note-on awaiting its note-off.
struct PendingNote {
  Tick start_tick = 0;
  uint8_t velocity = 0;
  int program = 0;
};

}  // namespace

// ---------------------------------------------------------------------------
// MidiReader -- public
// ---------------------------------------------------------------------------

bool MidiReader::read(const std::string& path) {
  FILE* file = std::fopen(path.c_str(), "rb");
  if (!file) {
    error_ = "Failed to open file: " + path;
    return false;
  }

  std::fseek(file, 0, SEEK_END);
  long file_size = std::ftell(file);
  std::fseek(file, 0, SEEK_SET);

  if (file_size <= 0) {
    std::fclose(file);
    error_ = "File is empty or unreadable: " + path;
    return false;
  }

  std::vector<uint8_t> data(static_cast<size_t>(file_size));
  size_t bytes_read = std::fread(data.data(), 1, data.size(), file);
  std::fclose(file);

  if (bytes_read != data.size()) {
    error_ = "Failed to read complete file: " + path;
    return false;
  }

  return read(data);
}

bool MidiReader::read(const std::vector<uint8_t>& data) {
  score_ = Score{};
  format_ = 0;
  num_tracks_ = 0;
  error_.clear();

  if (data.size() < 14) {
    error_ = "Data too small to be a valid MIDI file";
    return false;
  }

  if (!parseHeader(data.data(), data.size())) {
    return false;
  }

  size_t offset = 8 + readBE32(data.data(), 4);
  for (uint16_t idx = 0; idx < num_tracks_; ++idx) {
    if (!parseTrack(data.data(), data.size(), offset)) {
      return false;
    }
  }

  // Conductor events may come from any chunk: merge into tick order.
  std::stable_sort(score_.tempo_changes.begin(), score_.tempo_changes.end(),
                   [](const TempoChange& lhs, const TempoChange& rhs) {
                     return lhs.tick < rhs.tick;
                   });
  std::stable_sort(score_.time_signatures.begin(), score_.time_signatures.end(),
                   [](const TimeSignatureChange& lhs, const TimeSignatureChange& rhs) {
                     return lhs.tick < rhs.tick;
                   });
  score_.updateMaxTick();
  return true;
}

// ---------------------------------------------------------------------------
// MidiReader -- private
// ---------------------------------------------------------------------------

bool MidiReader::parseHeader(const uint8_t* data, size_t size) {
  if (std::memcmp(data, "MThd", 4) != 0) {
    error_ = "Invalid MIDI file: missing MThd header";
    return false;
  }

  uint32_t header_len = readBE32(data, 4);
  if (header_len < 6 || size < 8 + static_cast<size_t>(header_len)) {
    error_ = "Invalid MIDI header length";
    return false;
  }

  format_ = readBE16(data, 8);
  num_tracks_ = readBE16(data, 10);
  uint16_t division = readBE16(data, 12);

  if (format_ > 2) {
    error_ = "Unsupported MIDI format: " + std::to_string(format_);
    return false;
  }
  if ((division & 0x8000) != 0) {
    error_ = "SMPTE time division is not supported";
    return false;
  }
  if (division == 0) {
    error_ = "Invalid time division: 0";
    return false;
  }

  score_.time_division = division;
  return true;
}

bool MidiReader::parseTrack(const uint8_t* data, size_t size, size_t& offset) {
  if (offset + 8 > size) {
    error_ = "Unexpected end of data before track chunk";
    return false;
  }

  if (std::memcmp(data + offset, "MTrk", 4) != 0) {
    error_ = "Invalid track chunk: missing MTrk header";
    return false;
  }

  uint32_t track_len = readBE32(data, offset + 4);
  offset += 8;

  if (offset + track_len > size) {
    error_ = "Track chunk exceeds file size";
    return false;
  }

  size_t track_end = offset + track_len;
  std::string track_name;

  uint8_t running_status = 0;
  Tick abs_tick = 0;

  int channel_program[kNumChannels] = {};
  // Overlapping notes of one pitch close first-in, first-out.
  std::vector<std::deque<PendingNote>> pending(kNumChannels * kNumPitches);

  // program -> notes, in order of first note.
  std::map<int, std::vector<Note>> notes_by_program;
  std::vector<int> program_order;

  auto closeNote = [&](const PendingNote& open, uint8_t pitch, Tick end_tick) {
    Note note;
    note.pitch = pitch;
    note.velocity = open.velocity;
    note.start_tick = open.start_tick;
    note.end_tick = end_tick;
    note.program = open.program;
    auto& bucket = notes_by_program[open.program];
    if (bucket.empty()) program_order.push_back(open.program);
    bucket.push_back(note);
  };

  while (offset < track_end) {
    abs_tick += readVariableLength(data, offset, track_end);
    if (offset >= track_end) break;

    uint8_t byte = data[offset];

    // Meta event
    if (byte == 0xFF) {
      ++offset;
      if (offset >= track_end) break;

      uint8_t meta_type = data[offset++];
      if (offset >= track_end) break;

      uint32_t meta_len = readVariableLength(data, offset, track_end);
      if (offset + meta_len > track_end) break;

      if (meta_type == MetaType::kTrackName && meta_len > 0) {
        track_name.assign(reinterpret_cast<const char*>(data + offset), meta_len);
      } else if (meta_type == MetaType::kTempo && meta_len == 3) {
        uint32_t usec_per_beat = readBE24(data, offset);
        if (usec_per_beat > 0) {
          score_.tempo_changes.push_back(
              {static_cast<double>(kMicrosecondsPerMinute) / usec_per_beat, abs_tick});
        }
      } else if (meta_type == MetaType::kTimeSignature && meta_len >= 2) {
        uint8_t numerator = data[offset];
        uint8_t den_power = data[offset + 1];
        if (numerator > 0 && den_power < 8) {
          TimeSignature time_sig{numerator, static_cast<uint8_t>(1u << den_power)};
          score_.time_signatures.push_back({time_sig, abs_tick});
        }
      } else if (meta_type == MetaType::kEndOfTrack) {
        offset += meta_len;
        break;
      }

      offset += meta_len;
      continue;
    }

    // SysEx event
    if (byte == 0xF0 || byte == 0xF7) {
      ++offset;
      uint32_t sysex_len = readVariableLength(data, offset, track_end);
      offset += sysex_len;
      continue;
    }

    // Channel message
    uint8_t status;
    if (byte & 0x80) {
      status = byte;
      running_status = status;
      ++offset;
    } else if (running_status != 0) {
      status = running_status;
    } else {
      error_ = "Data byte without running status at tick " + std::to_string(abs_tick);
      return false;
    }

    uint8_t msg_type = status & 0xF0;
    uint8_t channel = status & 0x0F;

    if (msg_type == 0x90 || msg_type == 0x80) {
      if (offset + 1 >= track_end) break;
      uint8_t pitch = data[offset++] & 0x7F;
      uint8_t velocity = data[offset++] & 0x7F;
      auto& open_notes = pending[channel * kNumPitches + pitch];

      // Note On with velocity 0 is a Note Off.
      if (msg_type == 0x90 && velocity > 0) {
        int program = channel == kDrumChannel ? kDrumProgram : channel_program[channel];
        open_notes.push_back({abs_tick, velocity, program});
      } else if (!open_notes.empty()) {
        closeNote(open_notes.front(), pitch, abs_tick);
        open_notes.pop_front();
      }
    } else if (msg_type == 0xC0 || msg_type == 0xD0) {
      if (offset >= track_end) break;
      uint8_t data1 = data[offset++] & 0x7F;
      if (msg_type == 0xC0) channel_program[channel] = data1;
    } else {
      // Control Change, Pitch Bend, Key Pressure: 2 data bytes
      if (offset + 1 >= track_end) break;
      offset += 2;
    }
  }

  // Notes still sounding at the end of the chunk end there.
  for (size_t key = 0; key < pending.size(); ++key) {
    for (const auto& open : pending[key]) {
      closeNote(open, static_cast<uint8_t>(key % kNumPitches), abs_tick);
    }
  }

  offset = track_end;

  for (int program : program_order) {
    Track track;
    track.program = program;
    track.name = track_name.empty() ? gmProgramName(program) : track_name;
    track.notes = std::move(notes_by_program[program]);
    sortNotes(track.notes);
    score_.tracks.push_back(std::move(track));
  }
  return true;
}

}  // namespace remi
