/// @file
/// @brief Document assembly and the compile pipeline.

#include "compiler.h"

#include <cstdio>

#include "core/json_helpers.h"
#include "midi/channel_allocator.h"
#include "midi/midi_writer.h"
#include "track/timeline_builder.h"

namespace stylec {

namespace {

CompileResult failedResult(const CompileError& error) {
  CompileResult result;
  result.success = false;
  result.error_kind = error.kind;
  result.error_message = error.message;
  return result;
}

/// @brief Per-track progress line for --verbose runs.
void logTrack(const Track& track, const std::string& instrument_type) {
  std::string program = track.program ? std::to_string(*track.program) : "none";
  std::printf("[track] %s: instrument=%s channel=%u program=%s notes=%zu\n",
              track.name.c_str(), instrument_type.c_str(),
              static_cast<unsigned>(track.channel), program.c_str(), track.notes.size());
}

}  // namespace

bool applyConfigJson(const std::map<std::string, JsonValue>& kv, CompilerConfig& config,
                     std::string& error) {
  struct StringKey {
    const char* name;
    std::string* target;
  };
  const StringKey string_keys[] = {
      {"instruments_dir", &config.instruments_dir},
      {"tracks_dir", &config.tracks_dir},
      {"output", &config.output},
  };
  for (const auto& entry : string_keys) {
    auto it = kv.find(entry.name);
    if (it == kv.end()) continue;
    if (it->second.type != JsonValue::String) {
      error = std::string("config key '") + entry.name + "' must be a string, got " +
              it->second.typeName();
      return false;
    }
    *entry.target = it->second.asString();
  }

  auto it = kv.find("loops");
  if (it != kv.end()) {
    int loops = it->second.asInt(0);
    if (!it->second.fitsInt() || loops < 1 || loops > kMaxLoopCount) {
      error = "config key 'loops' must be an integer between 1 and " +
              std::to_string(kMaxLoopCount);
      return false;
    }
    config.loop_count = loops;
  }

  it = kv.find("bpm");
  if (it != kv.end()) {
    int bpm = it->second.asInt(0);
    if (!it->second.fitsInt() || bpm < 1 || bpm > 65535) {
      error = "config key 'bpm' must be an integer between 1 and 65535";
      return false;
    }
    config.bpm = static_cast<uint16_t>(bpm);
  }

  struct BoolKey {
    const char* name;
    bool* target;
  };
  const BoolKey bool_keys[] = {
      {"json", &config.json_output},
      {"verbose", &config.verbose},
  };
  for (const auto& entry : bool_keys) {
    auto found = kv.find(entry.name);
    if (found == kv.end()) continue;
    if (found->second.type != JsonValue::Bool) {
      error = std::string("config key '") + entry.name + "' must be a boolean, got " +
              found->second.typeName();
      return false;
    }
    *entry.target = found->second.asBool();
  }

  return true;
}

bool validateConfig(const CompilerConfig& config, std::string& error) {
  if (config.loop_count < 1 || config.loop_count > kMaxLoopCount) {
    error = "loop count must be between 1 and " + std::to_string(kMaxLoopCount);
    return false;
  }
  if (config.bpm == 0) {
    error = "bpm must be at least 1";
    return false;
  }
  if (config.instruments_dir.empty() || config.tracks_dir.empty() || config.output.empty()) {
    error = "instruments dir, tracks dir and output path must not be empty";
    return false;
  }
  return true;
}

CompileResult assembleDocument(const std::vector<TrackDefinition>& tracks,
                               const InstrumentRegistry& registry, const CompilerConfig& config) {
  CompileResult result;
  result.instrument_count = registry.size();
  result.document.bpm = config.bpm;

  uint32_t channel_counter = 0;
  const Tick tick_limit = maxReferenceTick(config.bpm);
  CompileError error;

  for (const auto& track_def : tracks) {
    const InstrumentDefinition* instrument = registry.findByType(track_def.instrument);
    if (!instrument) {
      fail(error, ErrorKind::UnresolvedInstrument,
           "Couldn't find an instrument of type '" + track_def.instrument + "' for track '" +
               track_def.name + "'");
      return failedResult(error);
    }

    ChannelAllocation allocation;
    if (!allocateChannel(*instrument, channel_counter, allocation, error)) {
      error.message += " (track '" + track_def.name + "')";
      return failedResult(error);
    }
    channel_counter = allocation.next_counter;

    Track& track = result.document.addTrack();
    track.name = track_def.name;
    if (allocation.assignment.assigned) {
      track.channel = allocation.assignment.channel;
      track.program = allocation.assignment.program;
    }

    if (!buildTimeline(track_def.notes, *instrument, config.loop_count, tick_limit, track.notes,
                       error)) {
      error.message += " (track '" + track_def.name + "')";
      return failedResult(error);
    }

    if (config.verbose) logTrack(track, instrument->type);
  }

  result.success = true;
  return result;
}

CompileResult compile(const CompilerConfig& config) {
  std::string config_error;
  if (!validateConfig(config, config_error)) {
    CompileError error;
    fail(error, ErrorKind::InvalidConfig, "Invalid configuration: " + config_error);
    return failedResult(error);
  }

  InstrumentRegistry registry;
  if (!registry.load(config.instruments_dir)) {
    return failedResult(registry.getError());
  }
  if (config.verbose) {
    std::printf("[load] %zu instruments from %s\n", registry.size(),
                config.instruments_dir.c_str());
  }

  std::vector<TrackDefinition> tracks;
  CompileError error;
  if (!loadTrackDirectory(config.tracks_dir, tracks, error)) {
    return failedResult(error);
  }
  if (tracks.empty()) {
    std::fprintf(stderr, "Warning: no track descriptors in %s\n", config.tracks_dir.c_str());
  } else if (config.verbose) {
    std::printf("[load] %zu tracks from %s\n", tracks.size(), config.tracks_dir.c_str());
  }

  return assembleDocument(tracks, registry, config);
}

std::string buildEventsJson(const EventDocument& document) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("bpm");
  writer.value(static_cast<int>(document.bpm));
  writer.key("tracks");
  writer.beginArray();
  for (const auto& track : document.tracks) {
    writer.beginObject();
    writer.key("name");
    writer.value(std::string_view(track.name));
    writer.key("channel");
    writer.value(static_cast<int>(track.channel));
    writer.key("program");
    if (track.program) {
      writer.value(static_cast<int>(*track.program));
    } else {
      writer.valueNull();
    }
    writer.key("notes");
    writer.beginArray();
    for (const auto& note : track.notes) {
      writer.beginObject();
      writer.key("pitch");
      writer.value(static_cast<int>(note.pitch));
      writer.key("time");
      writer.value(ticksToUnits(note.start_tick));
      writer.key("duration");
      writer.value(ticksToUnits(note.duration));
      writer.endObject();
    }
    writer.endArray();
    writer.endObject();
  }
  writer.endArray();
  writer.endObject();
  return writer.toString();
}

}  // namespace stylec
