// Track descriptors: the instrument a part plays and its ordered note entries.

#ifndef STYLEC_TRACK_TRACK_DEFINITION_H
#define STYLEC_TRACK_TRACK_DEFINITION_H

#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/json_parser.h"

namespace stylec {

/// One timeline slot: a single pitch or a chord, lasting one duration code.
struct NoteEntry {
  std::string duration;              // Duration code, e.g. "4" or "8."
  std::vector<std::string> pitches;  // One token for `pitch`, any number for `pitches`
};

/// One musical part; becomes exactly one output track.
struct TrackDefinition {
  std::string name;        // Descriptor base name, used as the MIDI track name
  std::string instrument;  // Instrument type tag
  std::vector<NoteEntry> notes;
};

/// @brief Build a TrackDefinition from a parsed descriptor.
///
/// Expected shape:
/// @code
///   {"track": {"instrument": "oud", "notes": [
///       {"pitch": "c4", "duration": 4},
///       {"pitches": ["c4", "e4", "g4"], "duration": "8."}]}}
/// @endcode
/// Each entry needs a duration and exactly one of `pitch` / `pitches`.
/// Integer durations and tokens are normalized to their decimal text.
///
/// @param root Parsed descriptor document.
/// @param source File name used in diagnostics.
/// @param track Receives the definition (name is left empty).
/// @param error Receives MalformedDescriptor on failure.
/// @return True on success.
bool parseTrackDescriptor(const JsonValue& root, const std::string& source,
                          TrackDefinition& track, CompileError& error);

/// @brief Parse descriptor text (JSON) into a TrackDefinition.
bool parseTrackText(const std::string& text, const std::string& source,
                    TrackDefinition& track, CompileError& error);

/// @brief Load every regular file of a directory as a track descriptor.
///
/// Tracks come back in listing order (sorted by file name), each named after
/// its file's base name.
///
/// @param dir Directory path.
/// @param tracks Receives the tracks.
/// @param error Receives IoError or MalformedDescriptor on failure.
/// @return True on success.
bool loadTrackDirectory(const std::string& dir, std::vector<TrackDefinition>& tracks,
                        CompileError& error);

}  // namespace stylec

#endif  // STYLEC_TRACK_TRACK_DEFINITION_H
