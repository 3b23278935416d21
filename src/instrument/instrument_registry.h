// Instrument registry: instrument descriptors loaded from a directory, keyed by
// file base name and searchable by type tag.

#ifndef STYLEC_INSTRUMENT_INSTRUMENT_REGISTRY_H
#define STYLEC_INSTRUMENT_INSTRUMENT_REGISTRY_H

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/json_parser.h"
#include "instrument/instrument_definition.h"

namespace stylec {

/// @brief Build an InstrumentDefinition from a parsed descriptor.
///
/// Expected shape:
/// @code
///   {"instrument": {"type": "darbuka", "program": 116, "pitchMap": {"dum": 36}}}
/// @endcode
/// `program` (1-128) and `pitchMap` (values 0-127) are optional. A present
/// pitchMap selects PitchMode::LookupTable.
///
/// @param root Parsed descriptor document.
/// @param source File name used in diagnostics.
/// @param instrument Receives the definition on success.
/// @param error Receives MalformedDescriptor on failure.
/// @return True on success.
bool parseInstrumentDescriptor(const JsonValue& root, const std::string& source,
                               InstrumentDefinition& instrument, CompileError& error);

/// @brief Parse descriptor text (JSON) into an InstrumentDefinition.
bool parseInstrumentText(const std::string& text, const std::string& source,
                         InstrumentDefinition& instrument, CompileError& error);

/// @brief Keyed collection of instrument definitions.
///
/// Keys are descriptor base names and only appear in diagnostics; tracks are
/// matched against the `type` field. Entries remember the order they were
/// first added in, which for load() is sorted file-name order.
class InstrumentRegistry {
 public:
  InstrumentRegistry() = default;

  /// @brief Load every regular file of a directory as an instrument descriptor.
  /// @param dir Directory path.
  /// @return True on success. On failure, call getError() for details.
  bool load(const std::string& dir);

  /// @brief Add or replace an entry.
  ///
  /// A replaced entry keeps the position of the entry it replaces.
  /// @param name Entry key (descriptor base name).
  /// @param instrument Instrument definition.
  void add(const std::string& name, const InstrumentDefinition& instrument);

  /// @brief Find the earliest-added instrument whose type equals the given tag.
  /// @param type Type tag named by a track.
  /// @return Pointer to the matching definition, or nullptr if none matches.
  const InstrumentDefinition* findByType(const std::string& type) const;

  size_t size() const { return instruments_.size(); }
  bool empty() const { return instruments_.empty(); }

  /// @brief Get the error from the last failed load().
  const CompileError& getError() const { return error_; }

 private:
  std::map<std::string, InstrumentDefinition> instruments_;
  std::vector<std::string> load_order_;
  CompileError error_;
};

}  // namespace stylec

#endif  // STYLEC_INSTRUMENT_INSTRUMENT_REGISTRY_H
