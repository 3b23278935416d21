/// @file
/// @brief Channel allocation with the percussion channel reserved.

#include "midi/channel_allocator.h"

#include <string>

namespace stylec {

bool allocateChannel(const InstrumentDefinition& instrument, uint32_t counter,
                     ChannelAllocation& allocation, CompileError& error) {
  allocation = ChannelAllocation{};
  allocation.next_counter = counter;

  if (instrument.isPercussion()) {
    allocation.assignment.assigned = true;
    allocation.assignment.channel = kPercussionChannel;
    return true;
  }

  if (!instrument.program) {
    return true;
  }

  uint32_t channel = counter;
  if (channel == kPercussionChannel) ++channel;
  if (channel > kMaxChannel) {
    return fail(error, ErrorKind::ChannelsExhausted,
                "No free MIDI channel left for instrument '" + instrument.type + "'");
  }

  allocation.assignment.assigned = true;
  allocation.assignment.channel = static_cast<uint8_t>(channel);
  allocation.assignment.program = static_cast<uint8_t>(*instrument.program - 1);
  allocation.next_counter = channel + 1;
  return true;
}

}  // namespace stylec
