// Basic types for the style compiler: timing units, note events, tracks and
// the event document handed to the MIDI writer.

#ifndef STYLEC_CORE_BASIC_TYPES_H
#define STYLEC_CORE_BASIC_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stylec {

/// Tick type for timeline positions (absolute tick position).
using Tick = uint32_t;

/// Reference resolution: one quarter note (one time-unit at the 60 BPM
/// reference tempo) is 480 ticks.
constexpr Tick kTicksPerBeat = 480;

/// Reference tempo the duration table is written against.
constexpr uint16_t kReferenceBpm = 60;

/// Header tempo written into the output document unless configured otherwise.
constexpr uint16_t kDefaultBpm = 120;

/// Number of times each track's note pattern is replayed.
constexpr int kDefaultLoopCount = 4;

/// Upper bound for the loop count, from the command line or a config file.
constexpr int kMaxLoopCount = 1000;

/// Highest valid MIDI channel (0-based).
constexpr uint8_t kMaxChannel = 15;

/// General MIDI percussion channel (the 10th channel, 0-based 9).
constexpr uint8_t kPercussionChannel = 9;

/// Note-on velocity for every emitted note (no dynamics).
constexpr uint8_t kDefaultVelocity = 127;

constexpr uint8_t kMaxMidiPitch = 127;

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

/// Failure categories. Every failure is fatal to the run.
enum class ErrorKind : uint8_t {
  None,
  UnknownDuration,       ///< Duration code missing from the duration table.
  UnknownPitch,          ///< Pitch token not resolvable for the instrument.
  UnresolvedInstrument,  ///< Track names an instrument type nobody defines.
  MalformedDescriptor,   ///< Descriptor text is not the expected shape.
  ChannelsExhausted,     ///< More programmed melodic tracks than MIDI channels.
  IoError,               ///< Directory or file could not be read or written.
  InvalidConfig,         ///< Configuration value out of range.
  TimelineTooLong        ///< A note would end past the last encodable MIDI tick.
};

/// @brief Convert ErrorKind to human-readable string.
const char* errorKindToString(ErrorKind kind);

/// Error value filled by operations that report failure through a bool.
struct CompileError {
  ErrorKind kind = ErrorKind::None;
  std::string message;

  bool ok() const { return kind == ErrorKind::None; }
};

/// @brief Fill an error and return false, for use in `return fail(...)`.
bool fail(CompileError& error, ErrorKind kind, const std::string& message);

// ---------------------------------------------------------------------------
// Timeline
// ---------------------------------------------------------------------------

/// @brief Convert reference ticks to time-units (quarter notes at 60 BPM).
inline constexpr double ticksToUnits(Tick tick) {
  return static_cast<double>(tick) / static_cast<double>(kTicksPerBeat);
}

/// Note event on a track timeline, in reference ticks.
struct NoteEvent {
  Tick start_tick = 0;
  Tick duration = 0;
  uint8_t pitch = 0;
  uint8_t velocity = kDefaultVelocity;
};

/// Track: a collection of note events on a single MIDI channel.
struct Track {
  std::string name;
  uint8_t channel = 0;
  std::optional<uint8_t> program;  // 0-based GM program; nullopt = no program change
  std::vector<NoteEvent> notes;
};

/// In-memory representation of the output file: header tempo plus tracks in
/// processing order. Built by a single owner and serialized once.
struct EventDocument {
  uint16_t bpm = kDefaultBpm;
  std::vector<Track> tracks;

  /// @brief Append an empty track and return a reference to it.
  Track& addTrack() {
    tracks.emplace_back();
    return tracks.back();
  }

  /// @brief Total number of note events across all tracks.
  size_t noteCount() const {
    size_t count = 0;
    for (const auto& track : tracks) count += track.notes.size();
    return count;
  }
};

}  // namespace stylec

#endif  // STYLEC_CORE_BASIC_TYPES_H
