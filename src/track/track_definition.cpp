/// @file
/// @brief Track descriptor parsing and directory loading.

#include "track/track_definition.h"

#include <utility>

#include "core/file_io.h"

namespace stylec {

namespace {

bool malformed(CompileError& error, const std::string& source, const std::string& what) {
  return fail(error, ErrorKind::MalformedDescriptor,
              "Malformed track descriptor '" + source + "': " + what);
}

/// @brief Read a string or number scalar as a token.
///
/// Integers that fit in int are normalized ("4.0" reads as "4"); any other
/// number keeps its source text.
/// @return False if the value is neither.
bool scalarToken(const JsonValue& value, std::string& token) {
  if (value.type == JsonValue::String) {
    token = value.string_val;
    return true;
  }
  if (value.type == JsonValue::Number) {
    token = value.fitsInt() ? std::to_string(value.asInt()) : value.number_text;
    return true;
  }
  return false;
}

bool parseNoteEntry(const JsonValue& value, const std::string& source, size_t index,
                    NoteEntry& entry, CompileError& error) {
  std::string where = "notes[" + std::to_string(index) + "]";
  if (value.type != JsonValue::Object) {
    return malformed(error, source, where + " must be an object");
  }

  const JsonValue* duration = value.find("duration");
  if (!duration || !scalarToken(*duration, entry.duration)) {
    return malformed(error, source, where + " needs a 'duration' code");
  }

  const JsonValue* pitch = value.find("pitch");
  const JsonValue* pitches = value.find("pitches");
  if (pitch && pitches) {
    return malformed(error, source, where + " has both 'pitch' and 'pitches'");
  }
  if (!pitch && !pitches) {
    return malformed(error, source, where + " needs 'pitch' or 'pitches'");
  }

  if (pitch) {
    std::string token;
    if (!scalarToken(*pitch, token)) {
      return malformed(error, source,
                       where + ".pitch must be a string, got " + pitch->typeName());
    }
    entry.pitches.push_back(token);
    return true;
  }

  if (pitches->type != JsonValue::Array) {
    return malformed(error, source,
                     where + ".pitches must be an array, got " + pitches->typeName());
  }
  for (size_t idx = 0; idx < pitches->items.size(); ++idx) {
    std::string token;
    if (!scalarToken(pitches->items[idx], token)) {
      return malformed(error, source,
                       where + ".pitches[" + std::to_string(idx) + "] must be a string");
    }
    entry.pitches.push_back(token);
  }
  return true;
}

}  // namespace

bool parseTrackDescriptor(const JsonValue& root, const std::string& source,
                          TrackDefinition& track, CompileError& error) {
  track = TrackDefinition{};

  const JsonValue* body = root.find("track");
  if (!body || body->type != JsonValue::Object) {
    return malformed(error, source, "missing top-level 'track' object");
  }

  const JsonValue* instrument = body->find("instrument");
  if (!instrument || instrument->type != JsonValue::String) {
    return malformed(error, source, "'instrument' must be a string");
  }
  track.instrument = instrument->string_val;

  const JsonValue* notes = body->find("notes");
  if (!notes || notes->type != JsonValue::Array) {
    return malformed(error, source, "'notes' must be an array");
  }

  track.notes.reserve(notes->items.size());
  for (size_t idx = 0; idx < notes->items.size(); ++idx) {
    NoteEntry entry;
    if (!parseNoteEntry(notes->items[idx], source, idx, entry, error)) {
      return false;
    }
    track.notes.push_back(std::move(entry));
  }
  return true;
}

bool parseTrackText(const std::string& text, const std::string& source,
                    TrackDefinition& track, CompileError& error) {
  JsonValue root;
  std::string parse_error;
  if (!parseJsonDocument(text.data(), text.size(), root, parse_error)) {
    return malformed(error, source, parse_error);
  }
  return parseTrackDescriptor(root, source, track, error);
}

bool loadTrackDirectory(const std::string& dir, std::vector<TrackDefinition>& tracks,
                        CompileError& error) {
  tracks.clear();

  std::vector<std::string> file_names;
  if (!listDirectory(dir, file_names, error)) {
    return false;
  }

  tracks.reserve(file_names.size());
  for (const auto& file_name : file_names) {
    std::string text;
    if (!readTextFile(joinPath(dir, file_name), text, error)) {
      return false;
    }

    TrackDefinition track;
    if (!parseTrackText(text, file_name, track, error)) {
      return false;
    }
    track.name = fileStem(file_name);
    tracks.push_back(std::move(track));
  }
  return true;
}

}  // namespace stylec
