/// @file
/// @brief Instrument descriptor parsing and registry lookups.

#include "instrument/instrument_registry.h"

#include <vector>

#include "core/file_io.h"

namespace stylec {

namespace {

constexpr int kMinProgram = 1;
constexpr int kMaxProgram = 128;

bool malformed(CompileError& error, const std::string& source, const std::string& what) {
  return fail(error, ErrorKind::MalformedDescriptor,
              "Malformed instrument descriptor '" + source + "': " + what);
}

}  // namespace

const char* pitchModeToString(PitchMode mode) {
  switch (mode) {
    case PitchMode::Formulaic:   return "formulaic";
    case PitchMode::LookupTable: return "lookup_table";
  }
  return "unknown";
}

bool parseInstrumentDescriptor(const JsonValue& root, const std::string& source,
                               InstrumentDefinition& instrument, CompileError& error) {
  instrument = InstrumentDefinition{};

  const JsonValue* body = root.find("instrument");
  if (!body || body->type != JsonValue::Object) {
    return malformed(error, source, "missing top-level 'instrument' object");
  }

  const JsonValue* type = body->find("type");
  if (!type || type->type != JsonValue::String) {
    return malformed(error, source, "'type' must be a string");
  }
  instrument.type = type->string_val;

  const JsonValue* program = body->find("program");
  if (program && program->type != JsonValue::Null) {
    if (!program->isInteger() || program->number_val < kMinProgram ||
        program->number_val > kMaxProgram) {
      return malformed(error, source, "'program' must be an integer between 1 and 128");
    }
    instrument.program = program->asInt();
  }

  const JsonValue* pitch_map = body->find("pitchMap");
  if (pitch_map && pitch_map->type != JsonValue::Null) {
    if (pitch_map->type != JsonValue::Object) {
      return malformed(error, source, "'pitchMap' must be an object");
    }
    for (const auto& member : pitch_map->members) {
      const JsonValue& pitch = member.value;
      if (!pitch.isInteger() || pitch.number_val < 0 || pitch.number_val > kMaxMidiPitch) {
        return malformed(error, source,
                         "pitchMap entry '" + member.key + "' must be an integer between 0 and 127");
      }
      instrument.pitch_map[member.key] = static_cast<uint8_t>(pitch.asInt());
    }
    instrument.pitch_mode = PitchMode::LookupTable;
  }

  return true;
}

bool parseInstrumentText(const std::string& text, const std::string& source,
                         InstrumentDefinition& instrument, CompileError& error) {
  JsonValue root;
  std::string parse_error;
  if (!parseJsonDocument(text.data(), text.size(), root, parse_error)) {
    return malformed(error, source, parse_error);
  }
  return parseInstrumentDescriptor(root, source, instrument, error);
}

// ---------------------------------------------------------------------------
// InstrumentRegistry
// ---------------------------------------------------------------------------

bool InstrumentRegistry::load(const std::string& dir) {
  instruments_.clear();
  load_order_.clear();
  error_ = CompileError{};

  std::vector<std::string> file_names;
  if (!listDirectory(dir, file_names, error_)) {
    return false;
  }

  for (const auto& file_name : file_names) {
    std::string text;
    if (!readTextFile(joinPath(dir, file_name), text, error_)) {
      return false;
    }

    InstrumentDefinition instrument;
    if (!parseInstrumentText(text, file_name, instrument, error_)) {
      return false;
    }
    add(fileStem(file_name), instrument);
  }
  return true;
}

void InstrumentRegistry::add(const std::string& name, const InstrumentDefinition& instrument) {
  if (instruments_.insert_or_assign(name, instrument).second) {
    load_order_.push_back(name);
  }
}

const InstrumentDefinition* InstrumentRegistry::findByType(const std::string& type) const {
  for (const auto& name : load_order_) {
    const InstrumentDefinition& instrument = instruments_.at(name);
    if (instrument.type == type) {
      return &instrument;
    }
  }
  return nullptr;
}

}  // namespace stylec
