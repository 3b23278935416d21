/// @file
/// @brief Binary MIDI stream helper implementations (VLQ, big-endian output).

#include "midi/midi_stream.h"

namespace stylec {

/// @brief Encode a value as a MIDI variable-length quantity and append to buf.
/// @param buf Destination byte buffer.
/// @param value Value to encode (clamped to 0x0FFFFFFF per MIDI spec).
void writeVariableLength(std::vector<uint8_t>& buf, uint32_t value) {
  if (value > kMaxVariableLength) value = kMaxVariableLength;

  // Highest non-empty 7-bit group first; every byte but the last has bit 7 set.
  int shift = 21;
  while (shift > 0 && (value >> shift) == 0) shift -= 7;
  for (; shift > 0; shift -= 7) {
    buf.push_back(static_cast<uint8_t>(((value >> shift) & 0x7F) | 0x80));
  }
  buf.push_back(static_cast<uint8_t>(value & 0x7F));
}

/// @brief Append a 16-bit value in big-endian byte order.
/// @param buf Destination byte buffer.
/// @param value Value to write (format, track count, division).
void writeBE16(std::vector<uint8_t>& buf, uint16_t value) {
  for (int shift = 8; shift >= 0; shift -= 8) {
    buf.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
  }
}

/// @brief Append a 32-bit value in big-endian byte order.
/// @param buf Destination byte buffer.
/// @param value Value to write (chunk lengths).
void writeBE32(std::vector<uint8_t>& buf, uint32_t value) {
  for (int shift = 24; shift >= 0; shift -= 8) {
    buf.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
  }
}

/// @brief Append a four-character chunk identifier.
/// @param buf Destination byte buffer.
/// @param id Chunk tag such as "MThd" or "MTrk"; exactly four bytes are copied.
void writeChunkId(std::vector<uint8_t>& buf, const char* id) {
  for (int idx = 0; idx < 4; ++idx) {
    buf.push_back(static_cast<uint8_t>(id[idx]));
  }
}

}  // namespace stylec
