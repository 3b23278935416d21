/// @file
/// @brief SMF Type 1 MIDI file writer implementation.

#include "midi/midi_writer.h"

#include <algorithm>
#include <cstdio>
#include <limits>

namespace stylec {

namespace {

/// @brief Internal event representation for sorting before writing.
struct WriteEvent {
  uint32_t tick = 0;
  uint8_t status = 0;
  uint8_t data1 = 0;
  uint8_t data2 = 0;
  int priority = 0;  // Lower = earlier at same tick (note-off before note-on)
};

/// @brief Append a meta event (FF type len data) at delta 0.
void writeMetaText(std::vector<uint8_t>& buf, uint8_t meta_type, const std::string& text) {
  writeVariableLength(buf, 0);
  buf.push_back(0xFF);
  buf.push_back(meta_type);
  writeVariableLength(buf, static_cast<uint32_t>(text.size()));
  for (char chr : text) {
    buf.push_back(static_cast<uint8_t>(chr));
  }
}

}  // namespace

Tick toFileTicks(Tick tick, uint16_t bpm) {
  if (bpm == 0) bpm = kDefaultBpm;
  uint64_t scaled = static_cast<uint64_t>(tick) * bpm / kReferenceBpm;
  return static_cast<Tick>(std::min<uint64_t>(scaled, kMaxVariableLength));
}

Tick maxReferenceTick(uint16_t bpm) {
  if (bpm == 0) bpm = kDefaultBpm;
  uint64_t limit = static_cast<uint64_t>(kMaxVariableLength) * kReferenceBpm / bpm;
  return static_cast<Tick>(std::min<uint64_t>(limit, std::numeric_limits<Tick>::max()));
}

MidiWriter::MidiWriter() = default;

void MidiWriter::build(const EventDocument& document) {
  data_.clear();

  uint16_t total_tracks = static_cast<uint16_t>(document.tracks.size() + 1);  // +1 conductor
  writeHeader(total_tracks, kTicksPerBeat);
  writeConductorTrack(document.bpm);

  for (const auto& track : document.tracks) {
    writeTrack(track, document.bpm);
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
  bool close_ok = std::fclose(file) == 0;
  return written == data_.size() && close_ok;
}

void MidiWriter::writeHeader(uint16_t num_tracks, uint16_t division) {
  writeChunkId(data_, "MThd");
  writeBE32(data_, 6);  // Header length: always 6
  writeBE16(data_, 1);  // Format: 1 (multi-track)
  writeBE16(data_, num_tracks);
  writeBE16(data_, division);  // Ticks per quarter note
}

void MidiWriter::writeConductorTrack(uint16_t bpm) {
  if (bpm == 0) bpm = kDefaultBpm;
  std::vector<uint8_t> track_buf;

  // Set Tempo: FF 51 03 tttttt (microseconds per quarter note)
  uint32_t usec_per_beat = kMicrosecondsPerMinute / bpm;
  writeVariableLength(track_buf, 0);
  track_buf.push_back(0xFF);
  track_buf.push_back(0x51);
  track_buf.push_back(0x03);
  track_buf.push_back(static_cast<uint8_t>((usec_per_beat >> 16) & 0xFF));
  track_buf.push_back(static_cast<uint8_t>((usec_per_beat >> 8) & 0xFF));
  track_buf.push_back(static_cast<uint8_t>(usec_per_beat & 0xFF));

  appendTrackChunk(track_buf);
}

void MidiWriter::writeTrack(const Track& track, uint16_t bpm) {
  std::vector<uint8_t> track_buf;
  uint8_t channel = track.channel & 0x0F;

  if (!track.name.empty()) {
    writeMetaText(track_buf, 0x03, track.name);  // Track Name
  }

  // Program change at tick 0, only when the instrument defines one.
  if (track.program) {
    writeVariableLength(track_buf, 0);
    track_buf.push_back(static_cast<uint8_t>(0xC0 | channel));
    track_buf.push_back(static_cast<uint8_t>(*track.program & 0x7F));
  }

  std::vector<WriteEvent> events;
  events.reserve(track.notes.size() * 2);

  for (const auto& note : track.notes) {
    Tick start = toFileTicks(note.start_tick, bpm);
    Tick end = toFileTicks(note.start_tick + note.duration, bpm);

    WriteEvent on_event;
    on_event.tick = start;
    on_event.status = static_cast<uint8_t>(0x90 | channel);
    on_event.data1 = note.pitch;
    on_event.data2 = note.velocity;
    on_event.priority = 1;
    events.push_back(on_event);

    WriteEvent off_event;
    off_event.tick = end;
    off_event.status = static_cast<uint8_t>(0x80 | channel);
    off_event.data1 = note.pitch;
    off_event.data2 = 0;
    off_event.priority = 0;
    events.push_back(off_event);
  }

  // Stable so that chord tones keep their written order.
  std::stable_sort(events.begin(), events.end(),
                   [](const WriteEvent& lhs, const WriteEvent& rhs) {
                     if (lhs.tick != rhs.tick) return lhs.tick < rhs.tick;
                     return lhs.priority < rhs.priority;
                   });

  uint32_t prev_tick = 0;
  for (const auto& evt : events) {
    writeVariableLength(track_buf, evt.tick - prev_tick);
    track_buf.push_back(evt.status);
    track_buf.push_back(evt.data1 & 0x7F);
    track_buf.push_back(evt.data2 & 0x7F);
    prev_tick = evt.tick;
  }

  appendTrackChunk(track_buf);
}

void MidiWriter::appendTrackChunk(std::vector<uint8_t>& track_buf) {
  // End of Track
  writeVariableLength(track_buf, 0);
  track_buf.push_back(0xFF);
  track_buf.push_back(0x2F);
  track_buf.push_back(0x00);

  writeChunkId(data_, "MTrk");
  writeBE32(data_, static_cast<uint32_t>(track_buf.size()));
  data_.insert(data_.end(), track_buf.begin(), track_buf.end());
}

}  // namespace stylec
