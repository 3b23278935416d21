// MIDI channel and program assignment per output track.

#ifndef STYLEC_MIDI_CHANNEL_ALLOCATOR_H
#define STYLEC_MIDI_CHANNEL_ALLOCATOR_H

#include <cstdint>
#include <optional>

#include "core/basic_types.h"
#include "instrument/instrument_definition.h"

namespace stylec {

/// Channel/program chosen for one track.
struct ChannelAssignment {
  bool assigned = false;           // False: program-less track on the default channel
  uint8_t channel = 0;
  std::optional<uint8_t> program;  // 0-based program change, if any
};

/// Result of one allocation step: the assignment plus the counter value to
/// pass to the next step.
struct ChannelAllocation {
  ChannelAssignment assignment;
  uint32_t next_counter = 0;
};

/// @brief Assign a channel and program to the next track.
///
/// The counter is threaded through the track loop by value and must be fed
/// tracks in processing order:
///   - percussion (pitch map present): channel 9, no program change, counter
///     unchanged, whatever `program` says;
///   - melodic with a program: channel = counter, skipping 9, program change
///     `program - 1`, counter advances past the taken channel;
///   - melodic without a program: nothing assigned, counter unchanged.
///
/// @param instrument Instrument of the track.
/// @param counter Current counter value (0 for the first track).
/// @param allocation Receives the assignment and the next counter value.
/// @param error Receives ChannelsExhausted if no melodic channel is left.
/// @return True on success.
bool allocateChannel(const InstrumentDefinition& instrument, uint32_t counter,
                     ChannelAllocation& allocation, CompileError& error);

}  // namespace stylec

#endif  // STYLEC_MIDI_CHANNEL_ALLOCATOR_H
