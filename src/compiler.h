// Style compiler entry point: instrument and track descriptors in, event
// document out.

#ifndef STYLEC_COMPILER_H
#define STYLEC_COMPILER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/json_parser.h"
#include "instrument/instrument_registry.h"
#include "track/track_definition.h"

namespace stylec {

/// @brief Configuration for a compile run.
struct CompilerConfig {
  std::string instruments_dir = "data/instruments";
  std::string tracks_dir = "data/tracks";
  std::string output = "output.mid";
  int loop_count = kDefaultLoopCount;
  uint16_t bpm = kDefaultBpm;
  bool json_output = false;
  bool verbose = false;
};

/// @brief Result from a compile run.
struct CompileResult {
  EventDocument document;
  size_t instrument_count = 0;
  bool success = false;
  ErrorKind error_kind = ErrorKind::None;
  std::string error_message;
};

/// @brief Apply config keys from a flat JSON object.
///
/// Recognized keys: instruments_dir, tracks_dir, output (strings), loops
/// (1..kMaxLoopCount), bpm (1..65535), json, verbose (booleans). Unknown keys
/// are ignored.
///
/// @param kv Key-value map, usually from jsonObjectToMap().
/// @param config Config to update in place.
/// @param error Receives a message naming the first bad key.
/// @return True if every recognized key had the right type and range.
bool applyConfigJson(const std::map<std::string, JsonValue>& kv, CompilerConfig& config,
                     std::string& error);

/// @brief Check value ranges (loop count 1..kMaxLoopCount, bpm >= 1, non-empty paths).
bool validateConfig(const CompilerConfig& config, std::string& error);

/// @brief Build the event document from already-loaded tracks.
///
/// Tracks are processed strictly in the given order: instrument lookup,
/// channel allocation (counter threaded from track to track), then timeline
/// layout. The first failure stops assembly.
///
/// @param tracks Track definitions in processing order.
/// @param registry Instruments to resolve track instrument types against.
/// @param config Loop count, header tempo and verbosity.
/// @return CompileResult with the document on success.
CompileResult assembleDocument(const std::vector<TrackDefinition>& tracks,
                               const InstrumentRegistry& registry, const CompilerConfig& config);

/// @brief Run the whole pipeline: load instruments, load tracks, assemble.
/// @param config Compile configuration.
/// @return CompileResult with the document on success.
CompileResult compile(const CompilerConfig& config);

/// @brief Build events JSON (tempo, tracks, notes in time-units) from a document.
std::string buildEventsJson(const EventDocument& document);

}  // namespace stylec

#endif  // STYLEC_COMPILER_H
