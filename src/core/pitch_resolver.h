// Pitch token resolution: formulaic note names for melodic voices, lookup
// tables for percussion voices.

#ifndef STYLEC_CORE_PITCH_RESOLVER_H
#define STYLEC_CORE_PITCH_RESOLVER_H

#include <cstdint>
#include <optional>
#include <string_view>

#include "core/basic_types.h"
#include "instrument/instrument_definition.h"

namespace stylec {

/// @brief Semitone offset of a note letter from C.
///
/// Only c, e and g are recognized.
///
/// @param letter Lower-case note letter.
/// @return Offset in semitones, or nullopt for an unsupported letter.
std::optional<int> letterOffset(char letter);

/// @brief Semitone offset of an accidental. Only the empty accidental (0) is
/// recognized.
std::optional<int> accidentalOffset(std::string_view accidental);

/// @brief Resolve a formulaic token "<letter><accidental><octave>".
///
/// pitch = (octave + 1) * 12 + letter + accidental, so "c4" is 60.
///
/// @param token Pitch token, e.g. "e4".
/// @return MIDI pitch, or nullopt when any part of the token is unsupported.
std::optional<uint8_t> formulaicPitch(std::string_view token);

/// @brief Resolve a pitch token for an instrument.
///
/// LookupTable instruments look the token up verbatim in their pitch map;
/// Formulaic instruments use formulaicPitch().
///
/// @param token Pitch token from a note entry.
/// @param instrument Instrument owning the track.
/// @param pitch Receives the MIDI pitch on success.
/// @param error Receives UnknownPitch on failure.
/// @return True on success.
bool resolvePitch(std::string_view token, const InstrumentDefinition& instrument,
                  uint8_t& pitch, CompileError& error);

}  // namespace stylec

#endif  // STYLEC_CORE_PITCH_RESOLVER_H
