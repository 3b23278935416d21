/// @file
/// @brief CLI entry point for the style compiler.

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include "compiler.h"
#include "core/basic_types.h"
#include "core/file_io.h"
#include "core/json_parser.h"
#include "midi/midi_writer.h"

namespace {

/// @brief Outcome of command-line parsing.
enum class ParseOutcome { Run, Help, Error };

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("stylec_cli - notation-to-MIDI style compiler\n\n");
  std::printf("Usage: stylec_cli [options]\n\n");
  std::printf("Options:\n");
  std::printf("  --config FILE      JSON config file (flags given after it override it)\n");
  std::printf("  --instruments DIR  Instrument descriptor directory (default: data/instruments)\n");
  std::printf("  --tracks DIR       Track descriptor directory (default: data/tracks)\n");
  std::printf("  -o FILE            Output MIDI file (default: output.mid)\n");
  std::printf("  --loops N          Pattern repetitions per track (default: 4)\n");
  std::printf("  --bpm N            Header tempo (default: 120)\n");
  std::printf("  --json             Also write <output>.json with all note events\n");
  std::printf("  --verbose          Log every loaded track\n");
  std::printf("  --help             Show this help\n");
}

/// @brief Parse a positive integer argument.
/// @return False if the text is not a whole number in [min_val, max_val].
bool parseIntArg(const char* text, long min_val, long max_val, long& out) {
  char* end = nullptr;
  long value = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || value < min_val || value > max_val) {
    return false;
  }
  out = value;
  return true;
}

/// @brief Load a --config file into config.
bool loadConfigFile(const std::string& path, stylec::CompilerConfig& config) {
  std::string text;
  stylec::CompileError io_error;
  if (!stylec::readTextFile(path, text, io_error)) {
    std::fprintf(stderr, "Error: %s\n", io_error.message.c_str());
    return false;
  }

  stylec::JsonValue root;
  std::string parse_error;
  if (!stylec::parseJsonDocument(text.data(), text.size(), root, parse_error) ||
      root.type != stylec::JsonValue::Object) {
    std::fprintf(stderr, "Error: config %s is not a JSON object%s%s\n", path.c_str(),
                 parse_error.empty() ? "" : ": ", parse_error.c_str());
    return false;
  }

  auto kv = stylec::jsonObjectToMap(root);
  std::string error;
  if (!stylec::applyConfigJson(kv, config, error)) {
    std::fprintf(stderr, "Error: %s (%s)\n", error.c_str(), path.c_str());
    return false;
  }
  return true;
}

/// @brief Parse command-line arguments into config.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param config Output structure populated with parsed values.
ParseOutcome parseArgs(int argc, char* argv[], stylec::CompilerConfig& config) {
  for (int idx = 1; idx < argc; ++idx) {
    const char* arg = argv[idx];
    bool has_value = idx + 1 < argc;

    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      printUsage();
      return ParseOutcome::Help;
    }
    if (std::strcmp(arg, "--json") == 0) {
      config.json_output = true;
    } else if (std::strcmp(arg, "--verbose") == 0) {
      config.verbose = true;
    } else if (std::strcmp(arg, "--config") == 0 && has_value) {
      if (!loadConfigFile(argv[++idx], config)) return ParseOutcome::Error;
    } else if (std::strcmp(arg, "--instruments") == 0 && has_value) {
      config.instruments_dir = argv[++idx];
    } else if (std::strcmp(arg, "--tracks") == 0 && has_value) {
      config.tracks_dir = argv[++idx];
    } else if (std::strcmp(arg, "-o") == 0 && has_value) {
      config.output = argv[++idx];
    } else if (std::strcmp(arg, "--loops") == 0 && has_value) {
      long loops = 0;
      if (!parseIntArg(argv[++idx], 1, stylec::kMaxLoopCount, loops)) {
        std::fprintf(stderr, "Error: --loops expects a number between 1 and %d\n",
                     stylec::kMaxLoopCount);
        return ParseOutcome::Error;
      }
      config.loop_count = static_cast<int>(loops);
    } else if (std::strcmp(arg, "--bpm") == 0 && has_value) {
      long bpm = 0;
      if (!parseIntArg(argv[++idx], 1, 65535, bpm)) {
        std::fprintf(stderr, "Error: --bpm expects a number between 1 and 65535\n");
        return ParseOutcome::Error;
      }
      config.bpm = static_cast<uint16_t>(bpm);
    } else {
      std::fprintf(stderr, "Error: unknown or incomplete option '%s' (see --help)\n", arg);
      return ParseOutcome::Error;
    }
  }
  return ParseOutcome::Run;
}

/// @brief JSON path next to the MIDI output ("out.mid" -> "out.json").
std::string jsonPathFor(const std::string& output) {
  std::string json_path = output;
  auto dot_pos = json_path.rfind('.');
  auto slash_pos = json_path.find_last_of("/\\");
  if (dot_pos != std::string::npos && (slash_pos == std::string::npos || dot_pos > slash_pos)) {
    json_path = json_path.substr(0, dot_pos) + ".json";
  } else {
    json_path += ".json";
  }
  return json_path;
}

}  // namespace

int main(int argc, char* argv[]) {
  stylec::CompilerConfig config;
  ParseOutcome outcome = parseArgs(argc, argv, config);
  if (outcome == ParseOutcome::Help) return 0;
  if (outcome == ParseOutcome::Error) return 1;

  std::printf("stylec_cli v0.1.0\n");
  std::printf("Instruments: %s\n", config.instruments_dir.c_str());
  std::printf("Tracks:      %s\n", config.tracks_dir.c_str());
  std::printf("Loops:       %d\n", config.loop_count);
  std::printf("BPM:         %u\n", static_cast<unsigned>(config.bpm));
  std::printf("\n");

  stylec::CompileResult result = stylec::compile(config);
  if (!result.success) {
    std::fprintf(stderr, "Error: [%s] %s\n", stylec::errorKindToString(result.error_kind),
                 result.error_message.c_str());
    return 1;
  }

  std::printf("Instruments: %zu loaded\n", result.instrument_count);
  std::printf("Tracks:      %zu\n", result.document.tracks.size());
  std::printf("Notes:       %zu\n", result.document.noteCount());

  stylec::MidiWriter writer;
  writer.build(result.document);
  if (!writer.writeToFile(config.output)) {
    std::fprintf(stderr, "Error: [%s] failed to write %s\n",
                 stylec::errorKindToString(stylec::ErrorKind::IoError), config.output.c_str());
    return 1;
  }
  std::printf("\nOutput:      %s\n", config.output.c_str());

  if (config.json_output) {
    std::string json_path = jsonPathFor(config.output);
    if (stylec::writeTextFile(json_path, stylec::buildEventsJson(result.document))) {
      std::printf("JSON:        %s\n", json_path.c_str());
    } else {
      std::fprintf(stderr, "Error: [%s] failed to write %s\n",
                   stylec::errorKindToString(stylec::ErrorKind::IoError), json_path.c_str());
      return 1;
    }
  }

  return 0;
}
