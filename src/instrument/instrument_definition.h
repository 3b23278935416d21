// Instrument descriptor: type tag, optional program, optional percussion map.

#ifndef STYLEC_INSTRUMENT_INSTRUMENT_DEFINITION_H
#define STYLEC_INSTRUMENT_INSTRUMENT_DEFINITION_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace stylec {

/// How pitch tokens are turned into MIDI pitches. Decided once at load time.
enum class PitchMode : uint8_t {
  Formulaic,   ///< <letter><accidental><octave> arithmetic (melodic voices).
  LookupTable  ///< Verbatim lookup in pitch_map (percussion voices).
};

/// @brief Convert PitchMode to human-readable string.
const char* pitchModeToString(PitchMode mode);

/// One playable voice, loaded from an instrument descriptor.
struct InstrumentDefinition {
  std::string type;
  std::optional<int> program;               // 1-based GM program (1-128)
  std::map<std::string, uint8_t> pitch_map;  // Used only in LookupTable mode
  PitchMode pitch_mode = PitchMode::Formulaic;

  /// @brief True when the descriptor carried a pitchMap (drum kit voice).
  bool isPercussion() const { return pitch_mode == PitchMode::LookupTable; }
};

}  // namespace stylec

#endif  // STYLEC_INSTRUMENT_INSTRUMENT_DEFINITION_H
