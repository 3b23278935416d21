// Helpers for writing binary MIDI data (variable-length quantities,
// big-endian integers, chunk ids).

#ifndef STYLEC_MIDI_MIDI_STREAM_H
#define STYLEC_MIDI_MIDI_STREAM_H

#include <cstdint>
#include <vector>

namespace stylec {

/// Microseconds per minute constant for MIDI tempo meta-events.
constexpr uint32_t kMicrosecondsPerMinute = 60000000;

/// Largest value a MIDI variable-length quantity can hold (4 bytes).
constexpr uint32_t kMaxVariableLength = 0x0FFFFFFF;

/// @brief Append a variable-length quantity (values above 0x0FFFFFFF are clamped).
void writeVariableLength(std::vector<uint8_t>& buf, uint32_t value);

void writeBE16(std::vector<uint8_t>& buf, uint16_t value);
void writeBE32(std::vector<uint8_t>& buf, uint32_t value);

/// @brief Append a four-character chunk identifier ("MThd", "MTrk").
void writeChunkId(std::vector<uint8_t>& buf, const char* id);

}  // namespace stylec

#endif  // STYLEC_MIDI_MIDI_STREAM_H
