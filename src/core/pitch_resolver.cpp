// Implementation of pitch token resolution.

#include "core/pitch_resolver.h"

#include <string>

namespace stylec {

namespace {

constexpr int kSemitonesPerOctave = 12;

/// @brief Build the diagnostic for an unresolvable token.
std::string unknownPitchMessage(std::string_view token, const InstrumentDefinition& instrument,
                                const char* reason) {
  std::string msg = "Unknown pitch '";
  msg += token;
  msg += "' in instrument '";
  msg += instrument.type;
  msg += "' (";
  msg += reason;
  msg += ")";
  return msg;
}

}  // namespace

std::optional<int> letterOffset(char letter) {
  switch (letter) {
    case 'c': return 0;
    case 'e': return 4;  // Major 3rd
    case 'g': return 7;  // Perfect 5th
    default:  return std::nullopt;
  }
}

std::optional<int> accidentalOffset(std::string_view accidental) {
  if (accidental.empty()) return 0;
  return std::nullopt;
}

std::optional<uint8_t> formulaicPitch(std::string_view token) {
  if (token.size() < 2) return std::nullopt;

  char octave_char = token.back();
  if (octave_char < '0' || octave_char > '9') return std::nullopt;
  int octave = octave_char - '0';

  auto letter = letterOffset(token.front());
  if (!letter) return std::nullopt;

  auto accidental = accidentalOffset(token.substr(1, token.size() - 2));
  if (!accidental) return std::nullopt;

  int pitch = (octave + 1) * kSemitonesPerOctave + *letter + *accidental;
  if (pitch < 0 || pitch > kMaxMidiPitch) return std::nullopt;
  return static_cast<uint8_t>(pitch);
}

bool resolvePitch(std::string_view token, const InstrumentDefinition& instrument,
                  uint8_t& pitch, CompileError& error) {
  if (instrument.pitch_mode == PitchMode::LookupTable) {
    auto iter = instrument.pitch_map.find(std::string(token));
    if (iter == instrument.pitch_map.end()) {
      return fail(error, ErrorKind::UnknownPitch,
                  unknownPitchMessage(token, instrument, "not in pitchMap"));
    }
    pitch = iter->second;
    return true;
  }

  auto resolved = formulaicPitch(token);
  if (!resolved) {
    return fail(error, ErrorKind::UnknownPitch,
                unknownPitchMessage(token, instrument,
                                    "expected <letter><accidental><octave> with letter c/e/g"));
  }
  pitch = *resolved;
  return true;
}

}  // namespace stylec
