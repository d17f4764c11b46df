/// @file
/// @brief SMF Type 1 MIDI file writer implementation.

#include "midi/midi_writer.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "midi/midi_stream.h"

namespace remi {

namespace {

/// @brief Internal event representation for sorting before writing.
struct WriteEvent {
  Tick tick = 0;
  uint8_t status = 0;
  uint8_t data1 = 0;
  uint8_t data2 = 0;
  int priority = 0;  // Lower = earlier at same tick (note-off before note-on)
};

/// Conductor meta event with its tick.
struct MetaEvent {
  Tick tick = 0;
  uint8_t type = 0;
  std::vector<uint8_t> payload;
};

/// @brief Exponent of a power-of-two denominator (4 -> 2).
uint8_t denominatorPower(uint8_t denominator) {
  uint8_t power = 0;
  while ((1u << (power + 1)) <= denominator && power < 7) ++power;
  return power;
}

/// @brief Channel of the n-th melodic track (channel 10 is reserved for drums).
uint8_t melodicChannel(size_t index) {
  uint8_t channel = static_cast<uint8_t>(index % 15);
  return channel >= kDrumChannel ? static_cast<uint8_t>(channel + 1) : channel;
}

}  // namespace

MidiWriter::MidiWriter() = default;

void MidiWriter::build(const Score& score) {
  data_.clear();

  uint16_t num_content_tracks = 0;
  for (const auto& track : score.tracks) {
    if (!track.notes.empty()) ++num_content_tracks;
  }

  writeHeader(static_cast<uint16_t>(num_content_tracks + 1), score.time_division);
  writeConductorTrack(score.tempo_changes, score.time_signatures);

  size_t melodic_index = 0;
  for (const auto& track : score.tracks) {
    if (track.notes.empty()) continue;
    uint8_t channel = track.isDrum() ? kDrumChannel : melodicChannel(melodic_index++);
    writeTrack(track, channel);
  }
}

std::vector<uint8_t> MidiWriter::toBytes() const {
  return data_;
}

bool MidiWriter::writeToFile(const std::string& path) const {
  FILE* file = std::fopen(path.c_str(), "wb");
  if (!file) {
    return false;
  }
  size_t written = std::fwrite(data_.data(), 1, data_.size(), file);
  bool closed = std::fclose(file) == 0;
  return written == data_.size() && closed;
}

void MidiWriter::writeHeader(uint16_t num_tracks, uint16_t division) {
  std::vector<uint8_t> header;
  writeBE16(header, 1);  // Format 1 (multi-track)
  writeBE16(header, num_tracks);
  writeBE16(header, division);
  writeChunk(data_, "MThd", header);
}

void MidiWriter::writeTrack(const Track& track, uint8_t channel) {
  std::vector<uint8_t> track_buf;

  if (!track.name.empty()) {
    writeMetaEvent(track_buf, 0, MetaType::kTrackName,
                   std::vector<uint8_t>(track.name.begin(), track.name.end()));
  }

  // Drums have no program change: channel 10 selects the kit.
  if (!track.isDrum()) {
    writeVariableLength(track_buf, 0);
    track_buf.push_back(static_cast<uint8_t>(0xC0 | (channel & 0x0F)));
    track_buf.push_back(static_cast<uint8_t>(std::clamp(track.program, 0, 127)));
  }

  std::vector<WriteEvent> events;
  events.reserve(track.notes.size() * 2);

  for (const auto& note : track.notes) {
    WriteEvent on_event;
    on_event.tick = note.start_tick;
    on_event.status = static_cast<uint8_t>(0x90 | (channel & 0x0F));
    on_event.data1 = note.pitch;
    on_event.data2 = std::max<uint8_t>(note.velocity, 1);
    on_event.priority = 1;
    events.push_back(on_event);

    WriteEvent off_event;
    off_event.tick = std::max(note.end_tick, note.start_tick);
    off_event.status = static_cast<uint8_t>(0x80 | (channel & 0x0F));
    off_event.data1 = note.pitch;
    off_event.data2 = 0;
    off_event.priority = 0;
    events.push_back(off_event);
  }

  std::stable_sort(events.begin(), events.end(),
                   [](const WriteEvent& lhs, const WriteEvent& rhs) {
                     if (lhs.tick != rhs.tick) return lhs.tick < rhs.tick;
                     return lhs.priority < rhs.priority;
                   });

  Tick prev_tick = 0;
  for (const auto& evt : events) {
    writeVariableLength(track_buf, evt.tick - prev_tick);
    track_buf.push_back(evt.status);
    track_buf.push_back(evt.data1 & 0x7F);
    track_buf.push_back(evt.data2 & 0x7F);
    prev_tick = evt.tick;
  }

  writeMetaEvent(track_buf, 0, MetaType::kEndOfTrack, {});
  writeChunk(data_, "MTrk", track_buf);
}

void MidiWriter::writeConductorTrack(const std::vector<TempoChange>& tempo_changes,
                                     const std::vector<TimeSignatureChange>& time_signatures) {
  std::vector<MetaEvent> events;

  std::vector<TempoChange> tempos = tempo_changes;
  if (tempos.empty()) tempos.push_back({static_cast<double>(kDefaultTempo), 0});
  for (const auto& change : tempos) {
    double bpm = change.tempo > 0.0 ? change.tempo : static_cast<double>(kDefaultTempo);
    auto usec_per_beat = static_cast<uint32_t>(std::lround(kMicrosecondsPerMinute / bpm));
    MetaEvent evt;
    evt.tick = change.tick;
    evt.type = MetaType::kTempo;
    writeBE24(evt.payload, std::min<uint32_t>(usec_per_beat, 0xFFFFFF));
    events.push_back(evt);
  }

  std::vector<TimeSignatureChange> meters = time_signatures;
  if (meters.empty()) meters.push_back({TimeSignature{}, 0});
  for (const auto& change : meters) {
    // FF 58 04 nn dd cc bb: 24 MIDI clocks per click, 8 32nds per quarter.
    MetaEvent evt;
    evt.tick = change.tick;
    evt.type = MetaType::kTimeSignature;
    evt.payload = {change.time_sig.numerator, denominatorPower(change.time_sig.denominator),
                   0x18, 0x08};
    events.push_back(evt);
  }

  // Time signatures before tempos at the same tick.
  std::stable_sort(events.begin(), events.end(), [](const MetaEvent& lhs, const MetaEvent& rhs) {
    if (lhs.tick != rhs.tick) return lhs.tick < rhs.tick;
    return lhs.type > rhs.type;
  });

  std::vector<uint8_t> track_buf;
  Tick prev_tick = 0;
  for (const auto& evt : events) {
    writeMetaEvent(track_buf, evt.tick - prev_tick, evt.type, evt.payload);
    prev_tick = evt.tick;
  }
  writeMetaEvent(track_buf, 0, MetaType::kEndOfTrack, {});
  writeChunk(data_, "MTrk", track_buf);
}

}  // namespace remi
