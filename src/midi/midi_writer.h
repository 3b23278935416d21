// MIDI writer. Serializes an EventDocument as a Standard MIDI File Type 1.

#ifndef STYLEC_MIDI_MIDI_WRITER_H
#define STYLEC_MIDI_MIDI_WRITER_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "midi/midi_stream.h"

namespace stylec {

/// @brief Convert a reference tick (60 BPM, 480 per quarter) to a file tick.
///
/// Note times are fixed in wall-clock terms: one time-unit lasts one second
/// whatever header tempo the file declares, so file ticks scale with bpm / 60.
///
/// @param tick Position or length in reference ticks.
/// @param bpm Header tempo of the file.
/// @return Position or length in file ticks (division kTicksPerBeat).
Tick toFileTicks(Tick tick, uint16_t bpm);

/// @brief Largest reference tick that still fits in the file at this tempo.
///
/// Any tick up to this value maps through toFileTicks() without clamping.
/// @param bpm Header tempo of the file.
/// @return Reference-tick ceiling for note ends.
Tick maxReferenceTick(uint16_t bpm);

/// @brief MIDI file writer that produces Standard MIDI File (SMF) Type 1 output.
///
/// Track 0 is a conductor track carrying the tempo. Every document track
/// follows in order, including tracks without notes.
class MidiWriter {
 public:
  MidiWriter();

  /// @brief Build complete MIDI data from a document.
  /// @param document Tempo and tracks to serialize.
  void build(const EventDocument& document);

  /// @brief Get the binary MIDI data after build().
  /// @return Byte vector containing complete SMF Type 1 data.
  std::vector<uint8_t> toBytes() const;

  /// @brief Write built MIDI data to a file, replacing any existing file.
  /// @param path Output file path.
  /// @return True if the file was written successfully.
  bool writeToFile(const std::string& path) const;

 private:
  std::vector<uint8_t> data_;

  /// Write the MThd (file header) chunk.
  void writeHeader(uint16_t num_tracks, uint16_t division);

  /// Write the conductor track (tempo meta-event).
  void writeConductorTrack(uint16_t bpm);

  /// Write a single track as an MTrk chunk with note events.
  void writeTrack(const Track& track, uint16_t bpm);

  /// Terminate a track buffer and append it as an MTrk chunk.
  void appendTrackChunk(std::vector<uint8_t>& track_buf);
};

}  // namespace stylec

#endif  // STYLEC_MIDI_MIDI_WRITER_H
